#include "symbol.hpp"

#include <iomanip>
#include <ios>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <redlog.hpp>

#include "d1sasm/util/utf8.hpp"

namespace d1::symbols {

namespace {

redlog::logger log_ = redlog::get_logger("d1.symbols.symbol");

void check_range(size_t bpos, size_t blen) {
  if (blen > std::numeric_limits<size_t>::max() - bpos) {
    log_.err("symbol range overflows", redlog::field("offset", bpos), redlog::field("length", blen));
    throw std::out_of_range("symbol offset + length overflows size_t");
  }
}

// names are text; ill-formed utf-8 is repaired before anything else sees it
symbol_name repair_utf8(symbol_name name) {
  if (util::is_valid_utf8(name.view())) {
    return name;
  }
  std::string repaired = util::to_utf8_lossy(name.view());
  log_.dbg("repaired ill-formed utf-8 in symbol name", redlog::field("name", repaired));
  return symbol_name(std::move(repaired));
}

} // namespace

symbol::symbol(
    symbol_name name, uint64_t addr, size_t bpos, size_t blen, symbol_type type, symbol_source source,
    symbol_lang lang
)
    : symbol(std::move(name), addr, bpos, blen, type, source, lang, symbol_demangler::standard()) {}

symbol::symbol(
    symbol_name name, uint64_t addr, size_t bpos, size_t blen, symbol_type type, symbol_source source,
    symbol_lang lang, const symbol_demangler& chain
)
    : addr_(addr), bpos_(bpos), blen_(blen), lang_(lang), source_(source), type_(type) {
  check_range(bpos, blen);

  // TODO: classify C names by stdcall/fastcall decoration (_name@8, @name@8)
  name = repair_utf8(std::move(name));
  if (auto demangled = chain.demangle(name.view())) {
    lang_ = update_lang(lang_, demangled->lang);
    log_.dbg("classified symbol", redlog::field("name", demangled->text),
             redlog::field("lang", std::string(to_string(lang_))));
    name_ = symbol_name(std::move(demangled->text));
  } else {
    name_ = std::move(name);
  }
}

symbol::symbol(normalized_tag, symbol_name name, uint64_t addr, size_t bpos, size_t blen, symbol_type type,
               symbol_source source, symbol_lang lang) noexcept
    : name_(std::move(name)), addr_(addr), bpos_(bpos), blen_(blen), lang_(lang), source_(source), type_(type) {}

symbol symbol::owned() const& {
  return symbol(normalized_tag{}, name_.to_owned(), addr_, bpos_, blen_, type_, source_, lang_);
}

symbol symbol::owned() && {
  return symbol(normalized_tag{}, std::move(name_).to_owned(), addr_, bpos_, blen_, type_, source_, lang_);
}

bool operator==(const symbol& lhs, const symbol& rhs) noexcept {
  return lhs.name_ == rhs.name_ && lhs.addr_ == rhs.addr_ && lhs.bpos_ == rhs.bpos_ && lhs.blen_ == rhs.blen_ &&
         lhs.lang_ == rhs.lang_ && lhs.source_ == rhs.source_ && lhs.type_ == rhs.type_;
}

std::ostream& operator<<(std::ostream& os, const symbol& sym) {
  std::ios_base::fmtflags flags = os.flags();
  char fill = os.fill();
  os << sym.type() << ' ' << sym.name() << " @ 0x" << std::hex << std::setfill('0') << std::setw(16) << sym.address();
  os.flags(flags);
  os.fill(fill);
  os << " [" << sym.offset() << ", " << sym.end() << ") " << sym.lang() << " from " << sym.source();
  return os;
}

} // namespace d1::symbols
