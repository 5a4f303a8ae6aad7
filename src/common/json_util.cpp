#include "devchain/common/json_util.hpp"

#include "devchain/common/fs.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace devchain::common {

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      if (i + 4 < raw.size()) {
        const long code = std::strtol(raw.substr(i + 1, 4).c_str(), nullptr, 16);
        out.push_back(code > 0 && code < 0x80 ? static_cast<char>(code) : '?');
        i += 4;
      }
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                     const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

namespace {

// Returns one past the end of the scalar or container starting at pos.
std::size_t json_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end;
}

} // namespace

JsonFlatMap json_parse_flat(const std::string &input) {
  JsonFlatMap result;
  const std::string json = trim(input);
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }

    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);

    const auto value_end = json_value_end(json, pos);
    if (value_end == std::string::npos) {
      break;
    }
    if (json[pos] == '"') {
      result[key] = json_unescape(json.substr(pos + 1, value_end - pos - 2));
    } else {
      result[key] = json.substr(pos, value_end - pos);
    }
    pos = value_end;
  }

  return result;
}

std::vector<std::string> json_split_array(const std::string &input) {
  std::vector<std::string> out;
  const std::string array_json = trim(input);
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  std::size_t pos = 1;
  while (pos + 1 < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos + 1 >= array_json.size()) {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = json_value_end(array_json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  for (const auto &element : json_split_array(array_json)) {
    if (element.size() >= 2 && element.front() == '"') {
      out.push_back(json_unescape(element.substr(1, element.size() - 2)));
    }
  }
  return out;
}

Result<std::vector<float>> json_parse_float_array(const std::string &array_json) {
  const std::string trimmed = trim(array_json);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument, "not a JSON array");
  }

  std::vector<float> values;
  for (const auto &element : json_split_array(trimmed)) {
    char *end = nullptr;
    const float parsed = std::strtof(element.c_str(), &end);
    if (end == element.c_str() || *end != '\0') {
      return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument,
                                                 "invalid number in array: " + element);
    }
    values.push_back(parsed);
  }
  return Result<std::vector<float>>::success(std::move(values));
}

bool json_is_null(const std::string &raw) {
  const std::string value = trim(raw);
  return value.empty() || value == "null";
}

} // namespace devchain::common
