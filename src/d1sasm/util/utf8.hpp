#pragma once

#include <string>
#include <string_view>

namespace d1::util {

// true if text is well-formed UTF-8 (no overlong forms, surrogates or code points past U+10FFFF)
bool is_valid_utf8(std::string_view text) noexcept;

/**
 * @brief copy text, replacing every maximal ill-formed subsequence with U+FFFD
 * @param text arbitrary bytes
 * @return well-formed UTF-8; identical to text when text is already valid
 */
std::string to_utf8_lossy(std::string_view text);

} // namespace d1::util
