#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace d1::symbols {

/**
 * @brief symbol name that either borrows caller bytes or owns its own buffer
 *
 * a borrowed name is a view into an upstream buffer (a string table, a debug section) that
 * must outlive it. to_owned() copies the bytes so the name survives that buffer.
 */
class symbol_name {
public:
  symbol_name() = default;
  symbol_name(std::string_view borrowed) noexcept : storage_(borrowed) {}
  symbol_name(const char* borrowed) noexcept
      : storage_(borrowed ? std::string_view(borrowed) : std::string_view()) {}
  symbol_name(std::string owned) noexcept : storage_(std::move(owned)) {}

  std::string_view view() const noexcept;
  bool is_borrowed() const noexcept { return std::holds_alternative<std::string_view>(storage_); }
  bool empty() const noexcept { return view().empty(); }

  symbol_name to_owned() const& { return symbol_name(std::string(view())); }
  symbol_name to_owned() &&;

  friend bool operator==(const symbol_name& lhs, const symbol_name& rhs) noexcept {
    return lhs.view() == rhs.view();
  }
  friend bool operator!=(const symbol_name& lhs, const symbol_name& rhs) noexcept { return !(lhs == rhs); }

private:
  std::variant<std::string_view, std::string> storage_;
};

} // namespace d1::symbols
