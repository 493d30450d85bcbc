// Copyright (c) 2023, Adam Simpkins
#include "usbpad/hid/gamepad/SwitchGamepadReport.h"

#include "usbpad/Error.h"
#include "usbpad/endian.h"

namespace usbpad::hid {

std::error_code SwitchGamepadReport::pack(Packed &out) const {
  return pack_into(out.data(), out.size());
}

std::error_code SwitchGamepadReport::pack_into(uint8_t *buf,
                                               size_t size) const {
  if (size < kSize) {
    return make_error_code(Error::SerializationError);
  }
  if (hat > kMaxHat) {
    return make_error_code(Error::SerializationError);
  }

  store_le16(buf, buttons);
  buf[2] = hat;
  buf[3] = padding;
  buf[4] = lx;
  buf[5] = ly;
  buf[6] = rx;
  buf[7] = ry;
  return std::error_code();
}

std::optional<SwitchGamepadReport>
SwitchGamepadReport::unpack(asel::buf_view data) {
  if (data.size() < kSize) {
    return std::nullopt;
  }

  SwitchGamepadReport report;
  report.buttons = load_le16(data.data());
  report.hat = data[2] & kMaxHat;
  report.padding = data[3];
  report.lx = data[4];
  report.ly = data[5];
  report.rx = data[6];
  report.ry = data[7];
  return report;
}

} // namespace usbpad::hid
