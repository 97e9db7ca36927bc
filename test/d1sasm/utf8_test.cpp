#include <doctest/doctest.h>

#include <string>

#include "d1sasm/util/utf8.hpp"

using d1::util::is_valid_utf8;
using d1::util::to_utf8_lossy;

TEST_CASE("is_valid_utf8 accepts well-formed text") {
  CHECK(is_valid_utf8(""));
  CHECK(is_valid_utf8("plain_symbol"));
  CHECK(is_valid_utf8("caf\xC3\xA9"));
  CHECK(is_valid_utf8("\xE2\x82\xAC"));
  CHECK(is_valid_utf8("\xF0\x9F\xA6\x80"));
}

TEST_CASE("is_valid_utf8 rejects ill-formed text") {
  CHECK_FALSE(is_valid_utf8("\xFF"));
  CHECK_FALSE(is_valid_utf8("\x80"));
  CHECK_FALSE(is_valid_utf8("\xC0\xAF"));         // overlong
  CHECK_FALSE(is_valid_utf8("\xED\xA0\x80"));     // surrogate
  CHECK_FALSE(is_valid_utf8("\xF4\x90\x80\x80")); // past U+10FFFF
  CHECK_FALSE(is_valid_utf8("\xE2\x82"));         // truncated
}

TEST_CASE("to_utf8_lossy leaves valid text unchanged") {
  CHECK(to_utf8_lossy("caf\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("to_utf8_lossy replaces each maximal invalid subpart once") {
  CHECK(to_utf8_lossy("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
  CHECK(to_utf8_lossy("a\xE2\x82") == "a\xEF\xBF\xBD");
  CHECK(to_utf8_lossy("a\xE0\x80z") == "a\xEF\xBF\xBD\xEF\xBF\xBDz");
}
