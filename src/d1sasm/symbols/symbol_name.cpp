#include "symbol_name.hpp"

#include <utility>

namespace d1::symbols {

std::string_view symbol_name::view() const noexcept {
  if (const auto* owned = std::get_if<std::string>(&storage_)) {
    return *owned;
  }
  return *std::get_if<std::string_view>(&storage_);
}

symbol_name symbol_name::to_owned() && {
  if (auto* owned = std::get_if<std::string>(&storage_)) {
    return symbol_name(std::move(*owned));
  }
  return symbol_name(std::string(*std::get_if<std::string_view>(&storage_)));
}

} // namespace d1::symbols
