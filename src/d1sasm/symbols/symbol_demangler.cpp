#include "symbol_demangler.hpp"

#include <utility>

#include "llvm_demangler.hpp"

namespace d1::symbols {

symbol_demangler::symbol_demangler(std::shared_ptr<const demangler> rust, std::shared_ptr<const demangler> cpp)
    : rust_(std::move(rust)), cpp_(std::move(cpp)) {}

std::optional<demangled_name> symbol_demangler::demangle(std::string_view name) const {
  if (rust_) {
    if (auto out = try_stage(*rust_, name)) {
      return out;
    }
  }
  if (cpp_) {
    if (auto out = try_stage(*cpp_, name)) {
      return out;
    }
  }
  return std::nullopt;
}

std::optional<demangled_name> symbol_demangler::try_stage(const demangler& stage, std::string_view name) const {
  auto rendered = stage.demangle(name);
  if (!rendered.ok()) {
    log_.ped("demangler rejected name", redlog::field("demangler", stage.get_name()),
             redlog::field("status", describe(rendered.status_info)));
    return std::nullopt;
  }

  log_.ped("demangler accepted name", redlog::field("demangler", stage.get_name()),
           redlog::field("demangled", rendered.value));
  return demangled_name{std::move(rendered.value), stage.language()};
}

const symbol_demangler& symbol_demangler::standard() {
  static const symbol_demangler instance(std::make_shared<rust_demangler>(), std::make_shared<itanium_demangler>());
  return instance;
}

symbol_demangler symbol_demangler::from_config(const symbols_config& config) {
  std::shared_ptr<const demangler> rust;
  std::shared_ptr<const demangler> cpp;

  if (config.demangle_rust) {
    rust_demangler::config rust_cfg;
    rust_cfg.accept_legacy = config.rust_legacy;
    rust = std::make_shared<rust_demangler>(rust_cfg);
  }
  if (config.demangle_cpp) {
    cpp = std::make_shared<itanium_demangler>();
  }

  auto log = redlog::get_logger("d1.symbols.config");
  log.dbg("demangle chain configured", redlog::field("rust", config.demangle_rust),
          redlog::field("rust_legacy", config.rust_legacy), redlog::field("cpp", config.demangle_cpp));

  return symbol_demangler(std::move(rust), std::move(cpp));
}

} // namespace d1::symbols
