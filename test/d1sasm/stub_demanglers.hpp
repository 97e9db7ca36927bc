#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "d1sasm/symbols/demangler.hpp"
#include "d1sasm/symbols/symbol_demangler.hpp"

namespace d1::test {

// demangler that accepts exactly the names in its table
class table_demangler : public symbols::demangler {
public:
  table_demangler(symbols::symbol_lang lang, std::map<std::string, std::string, std::less<>> table)
      : lang_(lang), table_(std::move(table)) {}

  result<std::string> demangle(std::string_view name) const override {
    auto it = table_.find(name);
    if (it == table_.end()) {
      return error_result<std::string>(error_code::not_mangled, "not in table");
    }
    return ok_result(it->second);
  }

  symbols::symbol_lang language() const override { return lang_; }
  std::string get_name() const override { return "table"; }

private:
  symbols::symbol_lang lang_;
  std::map<std::string, std::string, std::less<>> table_;
};

inline std::shared_ptr<const symbols::demangler> make_rust_stub(std::map<std::string, std::string, std::less<>> table) {
  return std::make_shared<table_demangler>(symbols::symbol_lang::rust, std::move(table));
}

inline std::shared_ptr<const symbols::demangler> make_cpp_stub(std::map<std::string, std::string, std::less<>> table) {
  return std::make_shared<table_demangler>(symbols::symbol_lang::cpp, std::move(table));
}

// chain where "both" is accepted by both stages, "rust_only"/"cpp_only" by one each
inline symbols::symbol_demangler make_stub_chain() {
  return symbols::symbol_demangler(
      make_rust_stub({{"both", "rust::both"}, {"rust_only", "rust::only"}}),
      make_cpp_stub({{"both", "cpp::both()"}, {"cpp_only", "cpp::only()"}})
  );
}

} // namespace d1::test
