#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "demangler.hpp"
#include "symbol_types.hpp"
#include "symbols_config.hpp"

namespace d1::symbols {

struct demangled_name {
  std::string text;
  symbol_lang lang = symbol_lang::unknown;
};

/**
 * @brief ordered two-stage demangle chain used when constructing symbols
 *
 * the rust stage is always tried first: its encoding rarely collides with anything else,
 * while the itanium grammar accepts inputs it should not. a null stage is skipped.
 */
class symbol_demangler {
public:
  symbol_demangler(std::shared_ptr<const demangler> rust, std::shared_ptr<const demangler> cpp);

  /**
   * @brief run the chain over a raw name
   * @param name raw symbol name
   * @return rendering and implied language of the first stage that accepts, nullopt if none does
   */
  std::optional<demangled_name> demangle(std::string_view name) const;

  const demangler* rust_stage() const noexcept { return rust_.get(); }
  const demangler* cpp_stage() const noexcept { return cpp_.get(); }

  // process-wide chain with both LLVM-backed stages enabled
  static const symbol_demangler& standard();

  static symbol_demangler from_config(const symbols_config& config);

private:
  std::shared_ptr<const demangler> rust_;
  std::shared_ptr<const demangler> cpp_;
  redlog::logger log_ = redlog::get_logger("d1.symbols.demangler");

  std::optional<demangled_name> try_stage(const demangler& stage, std::string_view name) const;
};

} // namespace d1::symbols
