#pragma once

#include <cstddef>

#include <capstone/capstone.h>

namespace d1::arch {

#if CS_API_MAJOR >= 6
using native_sysz = cs_systemz;
#else
using native_sysz = cs_sysz;
#endif

using native_mos65xx = cs_mos65xx;

struct layout {
  size_t size = 0;
  size_t align = 0;
};

template <typename T> constexpr layout layout_of() noexcept { return layout{sizeof(T), alignof(T)}; }

/**
 * @brief opaque per-instruction detail record for one architecture
 *
 * storage is laid out exactly like the capstone C struct so a record can be handed across
 * the C boundary by copy. nothing in d1sasm interprets the bytes.
 */
template <typename Native> struct alignas(alignof(Native)) opaque_details {
  using native_type = Native;

  unsigned char storage[sizeof(Native)];

  static opaque_details from_native(const Native& native) noexcept;
  Native as_native() const noexcept;
};

namespace mos65xx {
using details = opaque_details<native_mos65xx>;
}

namespace sysz {
using details = opaque_details<native_sysz>;
}

extern template struct opaque_details<native_mos65xx>;
extern template struct opaque_details<native_sysz>;

static_assert(sizeof(mos65xx::details) == sizeof(cs_mos65xx), "mos65xx details size mismatch");
static_assert(alignof(mos65xx::details) == alignof(cs_mos65xx), "mos65xx details alignment mismatch");
static_assert(sizeof(sysz::details) == sizeof(native_sysz), "sysz details size mismatch");
static_assert(alignof(sysz::details) == alignof(native_sysz), "sysz details alignment mismatch");

} // namespace d1::arch
