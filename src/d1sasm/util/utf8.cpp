#include "utf8.hpp"

#include <stdexcept>
#include <vector>

#include <llvm/Support/ConvertUTF.h>

namespace d1::util {

bool is_valid_utf8(std::string_view text) noexcept {
  const auto* source = reinterpret_cast<const llvm::UTF8*>(text.data());
  return llvm::isLegalUTF8String(&source, source + text.size());
}

std::string to_utf8_lossy(std::string_view text) {
  if (is_valid_utf8(text)) {
    return std::string(text);
  }

  // lenient decoding emits one U+FFFD per maximal ill-formed subpart
  std::vector<llvm::UTF32> code_points(text.size());
  const auto* source = reinterpret_cast<const llvm::UTF8*>(text.data());
  llvm::UTF32* decoded_end = code_points.data();
  llvm::ConversionResult decoded = llvm::ConvertUTF8toUTF32(
      &source, source + text.size(), &decoded_end, code_points.data() + code_points.size(), llvm::lenientConversion
  );
  if (decoded == llvm::targetExhausted) {
    throw std::length_error("utf-8 decode overflowed its buffer");
  }

  std::string out(code_points.size() * UNI_MAX_UTF8_BYTES_PER_CODE_POINT, '\0');
  const llvm::UTF32* encode_begin = code_points.data();
  auto* encoded_end = reinterpret_cast<llvm::UTF8*>(out.data());
  llvm::ConversionResult encoded = llvm::ConvertUTF32toUTF8(
      &encode_begin, decoded_end, &encoded_end, encoded_end + out.size(), llvm::strictConversion
  );
  if (encoded != llvm::conversionOK) {
    throw std::length_error("utf-8 re-encode overflowed its buffer");
  }

  out.resize(static_cast<size_t>(reinterpret_cast<char*>(encoded_end) - out.data()));
  return out;
}

} // namespace d1::util
