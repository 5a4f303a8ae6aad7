#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devchain/observability/factory.hpp"
#include "devchain/observability/global.hpp"
#include "devchain/observability/log_observer.hpp"
#include "devchain/observability/multi_observer.hpp"

#include <sstream>

void register_observability_tests(std::vector<devchain::tests::TestCase> &tests) {
  using devchain::tests::require;
  namespace obs = devchain::observability;
  namespace t = devchain::testing;

  tests.push_back({"log_observer_formats_levels", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, false);
                     observer.record_event(obs::WarningEvent{"generator", "slow batch"});
                     observer.record_event(obs::ErrorEvent{"store", "locked"});
                     observer.record_event(obs::DebugEvent{"graph", "hidden"});
                     observer.record_event(obs::GenerationEndEvent{
                         .total = 3, .generated = 2, .cached = 1, .errors = 0,
                         .duration = std::chrono::milliseconds(12)});
                     const std::string text = out.str();
                     require(text.find("[WARN] generator: slow batch") != std::string::npos,
                             "warning line");
                     require(text.find("[ERROR] store: locked") != std::string::npos, "error line");
                     require(text.find("hidden") == std::string::npos,
                             "debug suppressed unless verbose");
                     require(text.find("generated=2 cached=1") != std::string::npos,
                             "generation summary");
                   }});

  tests.push_back({"log_observer_verbose_shows_debug_and_metrics", [] {
                     std::ostringstream out;
                     obs::LogObserver observer(out, true);
                     observer.record_event(obs::DebugEvent{"graph", "expanded 4 nodes"});
                     observer.record_metric(obs::SnapshotSizeMetric{.vectors = 9});
                     const std::string text = out.str();
                     require(text.find("[DEBUG] graph: expanded 4 nodes") != std::string::npos,
                             "debug line");
                     require(text.find("metric.snapshot_vectors=9") != std::string::npos,
                             "metric line");
                   }});

  tests.push_back({"observer_factory_selects_backend", [] {
                     devchain::config::ObservabilityConfig config;
                     config.backend = "none";
                     require(obs::create_observer(config)->name() == "noop", "none -> noop");
                     config.backend = "log";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.backend = "log, none";
                     auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list -> multi");
                     auto *as_multi = dynamic_cast<obs::MultiObserver *>(multi.get());
                     require(as_multi != nullptr && as_multi->size() == 2, "two children");
                   }});

  tests.push_back({"global_recorders_reach_installed_observer", [] {
                     t::ScopedCapture capture;
                     obs::record_generation_start(true, "local-hash-v1-64");
                     obs::record_path_search("binary_sensor.x", 2, true,
                                             std::chrono::milliseconds(3));
                     obs::record_warning("catalog", "skipped");
                     const auto events = capture.observer().events();
                     require(events.size() == 3, "three events captured");
                     const auto *start = std::get_if<obs::GenerationStartEvent>(&events[0]);
                     require(start != nullptr && start->force_refresh, "start event");
                     const auto *search = std::get_if<obs::PathSearchEvent>(&events[1]);
                     require(search != nullptr && search->truncated && search->paths == 2,
                             "search event");
                     require(capture.observer().warnings() == 1, "one warning");
                   }});
}
