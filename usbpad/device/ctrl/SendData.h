// Copyright (c) 2024, Adam Simpkins
#pragma once

#include "usbpad/SetupPacket.h"
#include "usbpad/device/CtrlInXfer.h"
#include "usbpad/endian.h"
#include "usbpad/log.h"

#include <asel/array.h>

#include <algorithm>
#include <cstring>

namespace usbpad::device {

/**
 * Send a small amount of arbitrary data in an IN control transfer.
 *
 * This class keeps its own copy of the data until the transfer completes.
 * If the host requests fewer bytes than are available the response is
 * truncated.
 */
template <size_t NumBytes>
class SendData : public CtrlInXfer {
public:
  static constexpr size_t kNumBytes = NumBytes;

  SendData(MessagePipe *pipe, const uint8_t *data) : CtrlInXfer(pipe) {
    memcpy(data_.data(), data, data_.size());
  }

  void start(const SetupPacket &packet) override {
    send_full(data_.data(),
              std::min(static_cast<size_t>(packet.length), data_.size()));
  }
  void xfer_failed(XferFailReason reason) override {
    USBPAD_LOGW("SendData xfer failed: reason=%d", static_cast<int>(reason));
  }

private:
  asel::array<uint8_t, NumBytes> data_;
};

class SendU8 : public SendData<1> {
public:
  SendU8(MessagePipe *pipe, uint8_t value) : SendData(pipe, &value) {}
};

/**
 * Send a 16-bit value in little-endian byte order.
 */
class SendU16 : public SendData<2> {
public:
  SendU16(MessagePipe *pipe, uint16_t value)
      : SendData(pipe, encode(value).data()) {}

private:
  static asel::array<uint8_t, 2> encode(uint16_t value) {
    asel::array<uint8_t, 2> buf;
    store_le16(buf.data(), value);
    return buf;
  }
};

} // namespace usbpad::device
