#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace d1 {

// error codes for structured results
enum class error_code { ok, invalid_argument, not_mangled, internal_error };

constexpr std::string_view error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::not_mangled:
    return "not_mangled";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

// "code: message" for logs and diagnostics, or just "ok"
inline std::string describe(const status& info) {
  std::string out(error_code_name(info.code));
  if (!info.ok() && !info.message.empty()) {
    out += ": ";
    out += info.message;
  }
  return out;
}

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

} // namespace d1
