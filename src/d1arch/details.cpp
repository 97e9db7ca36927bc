#include "details.hpp"

#include <cstring>

namespace d1::arch {

template <typename Native> opaque_details<Native> opaque_details<Native>::from_native(const Native& native) noexcept {
  opaque_details out;
  std::memcpy(out.storage, &native, sizeof(Native));
  return out;
}

template <typename Native> Native opaque_details<Native>::as_native() const noexcept {
  Native out;
  std::memcpy(&out, storage, sizeof(Native));
  return out;
}

template struct opaque_details<native_mos65xx>;
template struct opaque_details<native_sysz>;

} // namespace d1::arch
