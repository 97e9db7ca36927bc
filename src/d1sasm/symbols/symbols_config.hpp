#pragma once

#include "d1sasm/util/env_config.hpp"

namespace d1::symbols {

/**
 * @brief D1SASM_* environment settings for the symbol layer
 *
 * from_environment() only reads values. verbose takes effect once the caller passes it to
 * apply_log_level(); demangle_* and rust_legacy take effect through symbol_demangler::from_config().
 */
struct symbols_config {
  int verbose = 0;
  bool demangle_rust = true;
  bool demangle_cpp = true;
  bool rust_legacy = true;

  static symbols_config from_environment() {
    util::env_config loader("D1SASM");

    symbols_config config;
    config.verbose = loader.get<int>("VERBOSE", 0);
    config.demangle_rust = loader.get<bool>("DEMANGLE_RUST", true);
    config.demangle_cpp = loader.get<bool>("DEMANGLE_CPP", true);
    config.rust_legacy = loader.get<bool>("RUST_LEGACY", true);
    return config;
  }
};

// map a verbosity count (symbols_config::verbose) onto the global redlog level
void apply_log_level(int verbose);

} // namespace d1::symbols
