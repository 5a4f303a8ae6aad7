#pragma once

#include "devchain/catalog/device.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace devchain::embedding {

/// Builds the short natural-language text that gets embedded for a device:
///   "<device label> that <primary action> in <area> area[ with <capabilities>]"
/// Output depends only on domain, device_class, area_id and the first
/// kMaxCapabilities capabilities, so identical inputs give identical bytes.
class DescriptorBuilder {
public:
  static constexpr std::size_t kMaxCapabilities = 3;

  [[nodiscard]] std::string build(const catalog::Device &device) const;
  [[nodiscard]] std::string build(const catalog::Device &device,
                                  const std::vector<std::string> &capabilities) const;
};

[[nodiscard]] std::string humanize_identifier(const std::string &identifier);
[[nodiscard]] std::string device_label(const std::string &domain,
                                       const std::optional<std::string> &device_class);
[[nodiscard]] std::string primary_action(const std::string &domain,
                                         const std::optional<std::string> &device_class);

} // namespace devchain::embedding
