#pragma once

#include <string>

namespace d1::util {

/**
 * @brief typed reader for prefixed environment variables
 *
 * a prefix of "D1SASM" turns get<int>("VERBOSE", 0) into a lookup of D1SASM_VERBOSE.
 * unset or empty variables yield the default; unparsable values are logged and yield the default.
 */
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;

} // namespace d1::util
