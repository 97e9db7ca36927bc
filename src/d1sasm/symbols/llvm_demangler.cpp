#include "llvm_demangler.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <llvm/Config/llvm-config.h>
#include <llvm/Demangle/Demangle.h>
#include <llvm/Support/ConvertUTF.h>

#include "d1sasm/util/string_utils.hpp"

namespace d1::symbols {

namespace {

struct malloc_deleter {
  void operator()(char* ptr) const noexcept { std::free(ptr); }
};

// LLVMDemangle hands back malloc'd buffers
using demangled_buffer = std::unique_ptr<char, malloc_deleter>;

struct llvm_outcome {
  demangled_buffer text;
  int status = llvm::demangle_unknown_error;
};

llvm_outcome run_itanium(const std::string& mangled) {
  llvm_outcome out;
#if LLVM_VERSION_MAJOR >= 17
  out.text.reset(llvm::itaniumDemangle(mangled));
  out.status = out.text ? llvm::demangle_success : llvm::demangle_invalid_mangled_name;
#else
  out.text.reset(llvm::itaniumDemangle(mangled.c_str(), nullptr, nullptr, &out.status));
#endif
  return out;
}

llvm_outcome run_rust(const std::string& mangled) {
  llvm_outcome out;
#if LLVM_VERSION_MAJOR >= 17
  out.text.reset(llvm::rustDemangle(mangled));
  out.status = out.text ? llvm::demangle_success : llvm::demangle_invalid_mangled_name;
#elif LLVM_VERSION_MAJOR >= 15
  out.text.reset(llvm::rustDemangle(mangled.c_str()));
  out.status = out.text ? llvm::demangle_success : llvm::demangle_invalid_mangled_name;
#else
  out.text.reset(llvm::rustDemangle(mangled.c_str(), nullptr, nullptr, &out.status));
#endif
  return out;
}

// legacy rust names may carry any of these in front of the itanium nested-name
constexpr std::string_view legacy_prefixes[] = {"__ZN", "_ZN", "ZN"};

constexpr size_t rust_hash_length = 17; // 'h' + 16 hex digits

bool is_rust_hash(std::string_view component) {
  if (component.size() != rust_hash_length || component.front() != 'h') {
    return false;
  }
  for (size_t i = 1; i < component.size(); ++i) {
    if (!util::is_hex_digit(component[i])) {
      return false;
    }
  }
  return true;
}

struct nested_name {
  std::vector<std::string_view> components;
  size_t end = 0; // offset just past the closing 'E'
};

// length-prefixed path components of an itanium nested-name body, or nullopt if malformed
std::optional<nested_name> parse_nested_name(std::string_view body) {
  nested_name out;
  size_t pos = 0;
  while (pos < body.size() && body[pos] != 'E') {
    size_t length = 0;
    size_t digits = 0;
    while (pos < body.size() && body[pos] >= '0' && body[pos] <= '9') {
      length = length * 10 + static_cast<size_t>(body[pos] - '0');
      ++pos;
      ++digits;
      if (length > body.size()) {
        return std::nullopt;
      }
    }
    if (digits == 0 || length == 0 || body.size() - pos < length) {
      return std::nullopt;
    }
    out.components.push_back(body.substr(pos, length));
    pos += length;
  }
  if (pos == body.size() || out.components.empty()) {
    return std::nullopt;
  }
  out.end = pos + 1;
  return out;
}

// printable ascii only (letters, digits, punctuation)
bool is_symbol_like(std::string_view text) {
  for (char ch : text) {
    auto byte = static_cast<unsigned char>(ch);
    if (byte >= 0x80 || !(std::isalnum(byte) || std::ispunct(byte))) {
      return false;
    }
  }
  return true;
}

// trailing words such as ".cold" or ".part.0" that compilers append after the mangled name
bool is_kept_suffix(std::string_view suffix) {
  return suffix.empty() || (suffix.front() == '.' && is_symbol_like(suffix));
}

// ThinLTO renames imported internal symbols to "<name>.llvm.<hex>"; that tail is dropped
std::string_view strip_llvm_suffix(std::string_view name) {
  constexpr std::string_view marker = ".llvm.";
  size_t at = name.find(marker);
  if (at == std::string_view::npos) {
    return name;
  }
  for (char ch : name.substr(at + marker.size())) {
    bool hex = (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'F');
    if (!hex && ch != '@') {
      return name;
    }
  }
  return name.substr(0, at);
}

struct split_name {
  std::string_view mangled;
  std::string_view suffix;
};

// v0 names use "_R", "__R" (apple) or "R" (windows) and always continue with an uppercase tag
std::optional<split_name> split_v0(std::string_view name) {
  constexpr std::string_view v0_prefixes[] = {"_R", "__R", "R"};
  for (std::string_view prefix : v0_prefixes) {
    if (!util::starts_with(name, prefix)) {
      continue;
    }
    std::string_view body = name.substr(prefix.size());
    if (body.empty() || body.front() < 'A' || body.front() > 'Z') {
      return std::nullopt;
    }
    // v0 paths never contain '.', so the first one starts the suffix
    size_t dot = body.find('.');
    if (dot == std::string_view::npos) {
      return split_name{body, {}};
    }
    return split_name{body.substr(0, dot), body.substr(dot)};
  }
  return std::nullopt;
}

std::optional<split_name> split_legacy(std::string_view name) {
  for (std::string_view prefix : legacy_prefixes) {
    if (!util::starts_with(name, prefix)) {
      continue;
    }
    std::string_view body = name.substr(prefix.size());
    auto parsed = parse_nested_name(body);
    if (!parsed || !is_rust_hash(parsed->components.back())) {
      return std::nullopt;
    }
    std::string_view suffix = body.substr(parsed->end);
    if (!is_kept_suffix(suffix)) {
      return std::nullopt;
    }
    // body without the prefix, up to and including the closing 'E'
    return split_name{body.substr(0, parsed->end), suffix};
  }
  return std::nullopt;
}

// text for a legacy "$..$" escape body, or nullopt if the escape is not recognized
std::optional<std::string> legacy_escape(std::string_view escape) {
  static constexpr std::pair<std::string_view, std::string_view> named[] = {
      {"SP", "@"}, {"BP", "*"}, {"RF", "&"}, {"LT", "<"}, {"GT", ">"}, {"LP", "("}, {"RP", ")"}, {"C", ","},
  };
  for (const auto& [key, text] : named) {
    if (escape == key) {
      return std::string(text);
    }
  }

  if (escape.size() < 2 || escape.size() > 7 || escape.front() != 'u') {
    return std::nullopt;
  }

  uint32_t code_point = 0;
  for (size_t i = 1; i < escape.size(); ++i) {
    char ch = escape[i];
    if (!util::is_hex_digit(ch)) {
      return std::nullopt;
    }
    uint32_t digit = ch <= '9' ? ch - '0' : (ch | 0x20) - 'a' + 10;
    code_point = code_point * 16 + digit;
  }

  // control characters stay escaped; surrogates and out-of-range values fail to encode
  if (code_point < 0x20 || (code_point >= 0x7F && code_point < 0xA0)) {
    return std::nullopt;
  }

  char encoded[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
  char* cursor = encoded;
  if (!llvm::ConvertCodePointToUTF8(code_point, cursor)) {
    return std::nullopt;
  }
  return std::string(encoded, cursor);
}

} // namespace

rust_demangler::rust_demangler(const config& cfg) : config_(cfg) {}

result<std::string> rust_demangler::demangle(std::string_view name) const {
  std::string_view stripped = strip_llvm_suffix(name);

  if (auto v0 = split_v0(stripped)) {
    if (!is_kept_suffix(v0->suffix)) {
      return error_result<std::string>(error_code::not_mangled, "unrecognized suffix after rust v0 symbol");
    }
    return demangle_v0(v0->mangled, v0->suffix);
  }
  if (config_.accept_legacy) {
    if (auto legacy = split_legacy(stripped)) {
      return demangle_legacy(legacy->mangled, legacy->suffix);
    }
  }
  return error_result<std::string>(error_code::not_mangled, "not a rust symbol");
}

result<std::string> rust_demangler::demangle_v0(std::string_view path, std::string_view suffix) const {
  log_.ped("demangling rust v0 symbol", redlog::field("path", std::string(path)),
           redlog::field("suffix", std::string(suffix)));

  std::string normalized = "_R";
  normalized.append(path);

  llvm_outcome outcome = run_rust(normalized);
  if (outcome.status != llvm::demangle_success || !outcome.text) {
    log_.ped("rust v0 demangle rejected", redlog::field("status", outcome.status));
    return error_result<std::string>(error_code::invalid_argument, "malformed rust v0 symbol");
  }

  std::string out(outcome.text.get());
  out.append(suffix);
  return ok_result(std::move(out));
}

result<std::string> rust_demangler::demangle_legacy(std::string_view body, std::string_view suffix) const {
  log_.ped("demangling legacy rust symbol", redlog::field("body", std::string(body)),
           redlog::field("suffix", std::string(suffix)));

  // normalize the prefix to the form the itanium parser accepts
  std::string normalized = "_ZN";
  normalized.append(body);

  llvm_outcome outcome = run_itanium(normalized);
  if (outcome.status != llvm::demangle_success || !outcome.text) {
    log_.ped("legacy rust demangle rejected", redlog::field("status", outcome.status));
    return error_result<std::string>(error_code::invalid_argument, "malformed legacy rust symbol");
  }

  std::string_view rendered(outcome.text.get());
  std::string out;
  out.reserve(rendered.size() + suffix.size());
  size_t start = 0;
  while (true) {
    size_t separator = rendered.find("::", start);
    std::string_view component =
        rendered.substr(start, separator == std::string_view::npos ? separator : separator - start);
    out.append(decode_legacy_component(component));
    if (separator == std::string_view::npos) {
      break;
    }
    out.append("::");
    start = separator + 2;
  }
  out.append(suffix);
  return ok_result(std::move(out));
}

bool rust_demangler::is_legacy_mangled(std::string_view name) {
  return split_legacy(strip_llvm_suffix(name)).has_value();
}

std::string rust_demangler::decode_legacy_component(std::string_view component) {
  std::string out;
  out.reserve(component.size());

  std::string_view rest = component;
  if (util::starts_with(rest, "_$")) {
    rest.remove_prefix(1);
  }

  while (!rest.empty()) {
    if (rest.front() == '.') {
      if (rest.size() > 1 && rest[1] == '.') {
        out.append("::");
        rest.remove_prefix(2);
      } else {
        out.push_back('.');
        rest.remove_prefix(1);
      }
      continue;
    }

    if (rest.front() == '$') {
      size_t end = rest.find('$', 1);
      if (end == std::string_view::npos) {
        break;
      }
      auto decoded = legacy_escape(rest.substr(1, end - 1));
      if (!decoded) {
        break;
      }
      out.append(*decoded);
      rest.remove_prefix(end + 1);
      continue;
    }

    size_t next = rest.find_first_of("$.");
    out.append(rest.substr(0, next));
    rest.remove_prefix(next == std::string_view::npos ? rest.size() : next);
  }

  // an unrecognized escape leaves the remainder untouched
  out.append(rest);
  return out;
}

result<std::string> itanium_demangler::demangle(std::string_view name) const {
  if (name.empty()) {
    return error_result<std::string>(error_code::not_mangled, "empty name");
  }

  log_.ped("demangling itanium symbol", redlog::field("name", std::string(name)));

  llvm_outcome outcome = run_itanium(std::string(name));
  if (outcome.status == llvm::demangle_success && outcome.text) {
    return ok_result(std::string(outcome.text.get()));
  }

  if (outcome.status == llvm::demangle_invalid_mangled_name) {
    return error_result<std::string>(error_code::not_mangled, "not an itanium symbol");
  }

  log_.dbg("itanium demangle failed", redlog::field("status", outcome.status));
  return error_result<std::string>(error_code::internal_error, "itanium demangler failure");
}

} // namespace d1::symbols
