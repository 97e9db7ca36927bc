#include <doctest/doctest.h>

#include <cstdint>
#include <cstring>

#include "d1arch/details.hpp"

using d1::arch::layout_of;

TEST_CASE("mos65xx details match the capstone layout") {
  constexpr auto ours = layout_of<d1::arch::mos65xx::details>();
  constexpr auto native = layout_of<cs_mos65xx>();
  CHECK(ours.size == native.size);
  CHECK(ours.align == native.align);
}

TEST_CASE("sysz details match the capstone layout") {
  constexpr auto ours = layout_of<d1::arch::sysz::details>();
  constexpr auto native = layout_of<d1::arch::native_sysz>();
  CHECK(ours.size == native.size);
  CHECK(ours.align == native.align);
}

TEST_CASE("mos65xx details carry a capstone detail record across") {
  csh handle = 0;
  REQUIRE(cs_open(CS_ARCH_MOS65XX, CS_MODE_MOS65XX_6502, &handle) == CS_ERR_OK);
  REQUIRE(cs_option(handle, CS_OPT_DETAIL, CS_OPT_ON) == CS_ERR_OK);

  const uint8_t code[] = {0xA9, 0x01}; // lda #$01
  cs_insn* insn = nullptr;
  size_t count = cs_disasm(handle, code, sizeof(code), 0x1000, 0, &insn);
  REQUIRE(count == 1);
  REQUIRE(insn[0].detail != nullptr);

  const cs_mos65xx& native = insn[0].detail->mos65xx;
  auto details = d1::arch::mos65xx::details::from_native(native);
  CHECK(std::memcmp(details.storage, &native, sizeof(native)) == 0);

  cs_mos65xx back = details.as_native();
  CHECK(back.op_count == native.op_count);
  CHECK(back.am == native.am);

  cs_free(insn, count);
  cs_close(&handle);
}
