#pragma once

#include <string>
#include <string_view>

#include <redlog.hpp>

#include "demangler.hpp"

namespace d1::symbols {

/**
 * @brief rust demangler backed by LLVMDemangle
 *
 * v0 names (_R, __R or R prefix) go through llvm::rustDemangle. legacy names are
 * itanium-shaped (_ZN...E) with a trailing 17h<16 hex digits> hash component; they are
 * rendered with the itanium grammar and then have the legacy $..$ escapes decoded. the hash
 * is kept in the output, e.g. "std::rt::lang_start::h0123456789abcdef".
 *
 * a ThinLTO ".llvm.<hex>" tail is dropped. other dot-separated suffixes such as ".cold" are
 * kept verbatim after the rendered path.
 */
class rust_demangler : public demangler {
public:
  struct config {
    bool accept_legacy;

    config() : accept_legacy(true) {}
  };

  explicit rust_demangler(const config& cfg = {});

  result<std::string> demangle(std::string_view name) const override;
  symbol_lang language() const override { return symbol_lang::rust; }
  std::string get_name() const override { return "llvm_rust"; }

  // true if name looks like a legacy rust symbol (itanium nested name ending in a rust hash,
  // optionally followed by a dot-separated suffix)
  static bool is_legacy_mangled(std::string_view name);

  // decode the legacy escapes of one demangled path component ("$LT$T$GT$" -> "<T>")
  static std::string decode_legacy_component(std::string_view component);

private:
  config config_;
  redlog::logger log_ = redlog::get_logger("d1.symbols.demangler.rust");

  // path is the v0 body after the "_R" prefix
  result<std::string> demangle_v0(std::string_view path, std::string_view suffix) const;
  // body is the legacy nested-name after the "_ZN" prefix, closing 'E' included
  result<std::string> demangle_legacy(std::string_view body, std::string_view suffix) const;
};

// itanium c++ abi demangler backed by LLVMDemangle
class itanium_demangler : public demangler {
public:
  result<std::string> demangle(std::string_view name) const override;
  symbol_lang language() const override { return symbol_lang::cpp; }
  std::string get_name() const override { return "llvm_itanium"; }

private:
  redlog::logger log_ = redlog::get_logger("d1.symbols.demangler.itanium");
};

} // namespace d1::symbols
