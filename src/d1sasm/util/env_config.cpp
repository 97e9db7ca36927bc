#include "env_config.hpp"

#include <cstdlib>
#include <exception>

#include <redlog.hpp>

#include "string_utils.hpp"

namespace d1::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? trim_copy(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }

  auto log = redlog::get_logger("d1.util.env_config");
  log.wrn("unrecognized boolean, using default", redlog::field("name", build_env_name(name)),
          redlog::field("value", value));
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      return parsed;
    }
  } catch (const std::exception& e) {
    auto log = redlog::get_logger("d1.util.env_config");
    log.wrn("failed to parse integer, using default", redlog::field("name", build_env_name(name)),
            redlog::field("error", e.what()));
    return default_value;
  }

  auto log = redlog::get_logger("d1.util.env_config");
  log.wrn("trailing characters in integer, using default", redlog::field("name", build_env_name(name)),
          redlog::field("value", value));
  return default_value;
}

} // namespace d1::util
