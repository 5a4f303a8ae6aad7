#include "devchain/graph/path_finder.hpp"

#include "devchain/observability/global.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <future>
#include <unordered_set>

namespace devchain::graph {

namespace {

struct SearchNode {
  std::vector<std::string> path;
  std::vector<double> similarities;
};

struct Candidate {
  std::string device_id;
  double similarity = 0.0;
};

} // namespace

FinderOptions options_from_config(const config::TraversalConfig &config) {
  return FinderOptions{.max_depth = config.max_depth,
                       .min_similarity = config.min_similarity,
                       .top_k_per_hop = config.top_k_per_hop,
                       .area_bonus = config.area_bonus,
                       .acceptance_floor = config.acceptance_floor,
                       .trigger_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(
                           std::min(config.trigger_timeout_ms, config::kMaxTriggerTimeoutMs))),
                       .worker_threads = config.worker_threads,
                       .max_results = config.max_results};
}

PathFinder::PathFinder(const VectorSnapshot &snapshot, const catalog::DeviceIndex &devices,
                       const PathScorer &scorer)
    : snapshot_(snapshot), devices_(devices), scorer_(scorer) {}

common::Status PathFinder::validate(const FinderOptions &options) {
  if (options.max_depth < kMinPathLength || options.max_depth > kMaxPathLength) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "max_depth must be between " + std::to_string(kMinPathLength) +
                                     " and " + std::to_string(kMaxPathLength) + ", got " +
                                     std::to_string(options.max_depth));
  }
  if (options.top_k_per_hop == 0) {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "top_k_per_hop must be at least 1");
  }
  return common::Status::success();
}

double PathFinder::hop_similarity(const std::string &from, const std::string &to,
                                  const double area_bonus) const {
  const auto *lhs = snapshot_.find(from);
  const auto *rhs = snapshot_.find(to);
  if (lhs == nullptr || rhs == nullptr) {
    return 0.0;
  }
  double similarity = static_cast<double>(embedding::dot(*lhs, *rhs));
  const auto lhs_device = devices_.find(from);
  const auto rhs_device = devices_.find(to);
  if (lhs_device != devices_.end() && rhs_device != devices_.end() &&
      catalog::share_area(lhs_device->second, rhs_device->second)) {
    similarity += area_bonus;
  }
  return std::min(similarity, 1.0);
}

TriggerOutcome PathFinder::search_trigger(const std::string &trigger,
                                          const FinderOptions &options) const {
  TriggerOutcome outcome;
  outcome.trigger = trigger;
  if (!snapshot_.contains(trigger)) {
    outcome.skipped = true;
    return outcome;
  }

  const auto deadline =
      std::chrono::steady_clock::now() +
      std::min(options.trigger_timeout,
               std::chrono::milliseconds(static_cast<std::int64_t>(config::kMaxTriggerTimeoutMs)));
  std::deque<SearchNode> queue;
  queue.push_back(SearchNode{.path = {trigger}, .similarities = {}});

  while (!queue.empty()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      outcome.truncated = true;
      break;
    }

    SearchNode node = std::move(queue.front());
    queue.pop_front();
    ++outcome.expanded_nodes;

    if (node.path.size() == options.max_depth) {
      Path path{.devices = std::move(node.path),
                .hop_similarities = std::move(node.similarities),
                .score = 0.0,
                .depth = 0};
      path.depth = path.devices.size() - 1;
      path.score = scorer_.score(path, devices_);
      if (path.score >= options.acceptance_floor) {
        outcome.paths.push_back(std::move(path));
      }
      continue;
    }

    const std::string &current = node.path.back();
    const std::unordered_set<std::string> visited(node.path.begin(), node.path.end());
    std::vector<Candidate> candidates;
    for (const auto &candidate_id : snapshot_.ids()) {
      if (visited.count(candidate_id) > 0) {
        continue;
      }
      const double similarity = hop_similarity(current, candidate_id, options.area_bonus);
      if (similarity >= options.min_similarity) {
        candidates.push_back(Candidate{.device_id = candidate_id, .similarity = similarity});
      }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate &lhs, const Candidate &rhs) {
      if (lhs.similarity != rhs.similarity) {
        return lhs.similarity > rhs.similarity;
      }
      return lhs.device_id < rhs.device_id;
    });
    if (candidates.size() > options.top_k_per_hop) {
      candidates.resize(options.top_k_per_hop);
    }

    for (const auto &candidate : candidates) {
      SearchNode child{.path = node.path, .similarities = node.similarities};
      child.path.push_back(candidate.device_id);
      child.similarities.push_back(candidate.similarity);
      queue.push_back(std::move(child));
    }
  }

  return outcome;
}

common::Result<SearchResult> PathFinder::find_paths(const std::vector<std::string> &triggers,
                                                    const FinderOptions &options) const {
  if (auto status = validate(options); !status.ok()) {
    return common::Result<SearchResult>::failure(status);
  }

  std::vector<std::string> unique_triggers;
  std::unordered_set<std::string> seen;
  for (const auto &trigger : triggers) {
    if (seen.insert(trigger).second) {
      unique_triggers.push_back(trigger);
    }
  }

  const auto run_one = [this, &options](const std::string &trigger) {
    const auto started = std::chrono::steady_clock::now();
    TriggerOutcome outcome = search_trigger(trigger, options);
    observability::record_path_search(
        trigger, outcome.paths.size(), outcome.truncated,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started));
    return outcome;
  };

  std::vector<TriggerOutcome> outcomes;
  outcomes.reserve(unique_triggers.size());
  const std::size_t workers = std::max<std::size_t>(options.worker_threads, 1);
  if (workers == 1) {
    for (const auto &trigger : unique_triggers) {
      outcomes.push_back(run_one(trigger));
    }
  } else {
    for (std::size_t start = 0; start < unique_triggers.size(); start += workers) {
      const std::size_t end = std::min(unique_triggers.size(), start + workers);
      std::vector<std::future<TriggerOutcome>> pending;
      pending.reserve(end - start);
      for (std::size_t i = start; i < end; ++i) {
        pending.push_back(std::async(std::launch::async, run_one, std::cref(unique_triggers[i])));
      }
      for (auto &future : pending) {
        outcomes.push_back(future.get());
      }
    }
  }

  SearchResult result;
  for (auto &outcome : outcomes) {
    if (outcome.skipped) {
      observability::record_warning("graph.path_finder",
                                    "trigger " + outcome.trigger + " has no fresh embedding; skipped");
      result.skipped_triggers.push_back(outcome.trigger);
      continue;
    }
    if (outcome.truncated) {
      observability::record_warning("graph.path_finder",
                                    "trigger " + outcome.trigger + " timed out after " +
                                        std::to_string(options.trigger_timeout.count()) +
                                        " ms; keeping " + std::to_string(outcome.paths.size()) +
                                        " paths");
      result.truncated_triggers.push_back(outcome.trigger);
    }
    for (auto &path : outcome.paths) {
      result.paths.push_back(std::move(path));
    }
  }

  std::sort(result.paths.begin(), result.paths.end(), path_ranks_before);
  if (options.max_results > 0 && result.paths.size() > options.max_results) {
    result.paths.resize(options.max_results);
  }
  return common::Result<SearchResult>::success(std::move(result));
}

} // namespace devchain::graph
