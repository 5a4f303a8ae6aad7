#include "devchain/embedding/descriptor.hpp"

#include "devchain/common/fs.hpp"

#include <string_view>
#include <unordered_map>

namespace devchain::embedding {

namespace {

const std::unordered_map<std::string_view, std::string_view> &class_labels() {
  static const std::unordered_map<std::string_view, std::string_view> labels = {
      {"motion", "motion sensor"},
      {"occupancy", "occupancy sensor"},
      {"presence", "presence sensor"},
      {"door", "door sensor"},
      {"garage_door", "garage door sensor"},
      {"window", "window sensor"},
      {"opening", "opening sensor"},
      {"vibration", "vibration sensor"},
      {"sound", "sound sensor"},
      {"smoke", "smoke detector"},
      {"gas", "gas detector"},
      {"carbon_monoxide", "carbon monoxide detector"},
      {"carbon_dioxide", "carbon dioxide sensor"},
      {"moisture", "leak sensor"},
      {"temperature", "temperature sensor"},
      {"humidity", "humidity sensor"},
      {"illuminance", "light level sensor"},
      {"pressure", "pressure sensor"},
      {"battery", "battery sensor"},
      {"power", "power meter"},
      {"energy", "energy meter"},
      {"outlet", "smart outlet"},
      {"plug", "smart plug"},
      {"doorbell", "doorbell"},
      {"tv", "television"},
      {"speaker", "speaker"},
      {"blind", "window blind"},
      {"shade", "window shade"},
      {"curtain", "curtain"},
      {"awning", "awning"},
  };
  return labels;
}

const std::unordered_map<std::string_view, std::string_view> &domain_nouns() {
  static const std::unordered_map<std::string_view, std::string_view> nouns = {
      {"binary_sensor", "sensor"},
      {"sensor", "sensor"},
      {"light", "light"},
      {"switch", "switch"},
      {"climate", "thermostat"},
      {"lock", "lock"},
      {"cover", "cover"},
      {"fan", "fan"},
      {"media_player", "media player"},
      {"camera", "camera"},
      {"vacuum", "vacuum"},
      {"alarm_control_panel", "alarm panel"},
      {"siren", "siren"},
      {"button", "button"},
      {"event", "event source"},
      {"scene", "scene"},
      {"humidifier", "humidifier"},
      {"water_heater", "water heater"},
      {"valve", "valve"},
  };
  return nouns;
}

const std::unordered_map<std::string_view, std::string_view> &domain_actions() {
  static const std::unordered_map<std::string_view, std::string_view> actions = {
      {"light", "controls lighting"},
      {"switch", "switches power"},
      {"climate", "controls temperature"},
      {"lock", "locks and unlocks"},
      {"cover", "opens and closes"},
      {"fan", "controls airflow"},
      {"media_player", "plays media"},
      {"camera", "records video"},
      {"vacuum", "cleans floors"},
      {"alarm_control_panel", "arms and disarms security"},
      {"siren", "sounds alarms"},
      {"button", "triggers on press"},
      {"event", "reports events"},
      {"scene", "activates a scene"},
      {"humidifier", "controls humidity"},
      {"water_heater", "heats water"},
      {"valve", "opens and closes flow"},
  };
  return actions;
}

std::string join_capabilities(const std::vector<std::string> &names) {
  std::string out;
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      out += (i + 1 == names.size()) ? " and " : ", ";
    }
    out += names[i];
  }
  return out;
}

} // namespace

std::string humanize_identifier(const std::string &identifier) {
  std::string out;
  out.reserve(identifier.size());
  bool pending_space = false;
  for (const char raw : common::to_lower(common::trim(identifier))) {
    if (raw == '_' || raw == '-' || raw == '.' || raw == ' ') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(raw);
  }
  return out;
}

std::string device_label(const std::string &domain, const std::optional<std::string> &device_class) {
  const std::string domain_key = common::to_lower(domain);
  const auto noun_it = domain_nouns().find(domain_key);
  const std::string noun =
      noun_it != domain_nouns().end() ? std::string(noun_it->second) : humanize_identifier(domain);

  if (!device_class.has_value() || common::trim(*device_class).empty()) {
    return (noun.empty() ? std::string("unknown") : noun) + " device";
  }

  const std::string class_key = common::to_lower(common::trim(*device_class));
  if (const auto it = class_labels().find(class_key); it != class_labels().end()) {
    return std::string(it->second);
  }
  const std::string humanized = humanize_identifier(class_key);
  return noun.empty() ? humanized : humanized + " " + noun;
}

std::string primary_action(const std::string &domain, const std::optional<std::string> &device_class) {
  const std::string domain_key = common::to_lower(domain);
  const bool has_class = device_class.has_value() && !common::trim(*device_class).empty();
  if (domain_key == "binary_sensor") {
    return has_class ? "detects " + humanize_identifier(*device_class) : "detects state changes";
  }
  if (domain_key == "sensor") {
    return has_class ? "measures " + humanize_identifier(*device_class) : "measures values";
  }
  if (const auto it = domain_actions().find(domain_key); it != domain_actions().end()) {
    return std::string(it->second);
  }
  return "reports state";
}

std::string DescriptorBuilder::build(const catalog::Device &device) const {
  return build(device, device.capabilities);
}

std::string DescriptorBuilder::build(const catalog::Device &device,
                                     const std::vector<std::string> &capabilities) const {
  std::string area = "unknown";
  if (device.area_id.has_value()) {
    const std::string humanized = humanize_identifier(*device.area_id);
    if (!humanized.empty()) {
      area = humanized;
    }
  }

  std::string text = device_label(device.domain, device.device_class);
  text += " that ";
  text += primary_action(device.domain, device.device_class);
  text += " in ";
  text += area;
  text += " area";

  std::vector<std::string> names;
  for (const auto &capability : capabilities) {
    if (names.size() == kMaxCapabilities) {
      break;
    }
    std::string humanized = humanize_identifier(capability);
    if (!humanized.empty()) {
      names.push_back(std::move(humanized));
    }
  }
  if (!names.empty()) {
    text += " with ";
    text += join_capabilities(names);
  }
  return text;
}

} // namespace devchain::embedding
