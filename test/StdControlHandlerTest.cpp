// Copyright (c) 2023, Adam Simpkins
#include "usbpad/device/StdControlHandler.h"

#include "usbpad/SetupPacket.h"
#include "usbpad/UsbDevice.h"
#include "usbpad/desc/DeviceDescriptor.h"
#include "usbpad/desc/StaticDescriptorMap.h"
#include "usbpad/device/EndpointManager.h"
#include "usbpad/device/EndpointZero.h"
#include "usbpad/hw/mock/MockDevice.h"
#include "test/lib/GamepadTestDevice.h"
#include "test/lib/mock_utils.h"

#include <asel/test/TestCase.h>
#include <asel/test/checks.h>

using namespace usbpad::device;

namespace usbpad::test {

namespace {
constexpr auto make_descriptor_map() {
  DeviceDescriptor dev;
  dev.set_vendor(0xcafe);
  dev.set_product(0xd00d);
  dev.set_class(UsbClass::Hid, 1, 2);
  dev.set_device_release(12, 34);

  return StaticDescriptorMap().add_device_descriptor(dev);
}

const auto kDescriptors = make_descriptor_map();

class TestControlHandlerCallback : public StdControlHandlerCallback {
public:
  bool set_configuration(uint8_t config_id) override {
    return false;
  }
  std::optional<asel::buf_view> get_descriptor(uint16_t value,
                                               uint16_t index) override {
    return kDescriptors.get_descriptor_with_setup_ids(value, index);
  }
  bool is_self_powered() const override {
    return self_powered;
  }

  bool self_powered = false;
};

constexpr SetupPacket kGetDevDescriptor =
    make_setup(0x80, // IN, Device, Standard request
               static_cast<uint8_t>(StdRequestType::GetDescriptor),
               0x0100, // Device descriptor
               0,
               18);

std::array<uint8_t, 18> expected_dev_descriptor(uint8_t ep0_mps) {
  return {{
      18,   // length
      1,    // descriptor type: device
      0,    // USB minor version
      2,    // USB major version
      3,    // class
      1,    // subclass
      2,    // protocol
      ep0_mps,
      0xfe, // vendor (lower half)
      0xca, // vendor (upper half)
      0x0d, // product (lower half)
      0xd0, // product (upper half)
      0x34, // device version (lower half)
      0x12, // device version (upper half)
      1,    // manufacturer string index
      2,    // product string index
      3,    // serial string index
      1,    // num configurations
  }};
}

} // namespace

ASEL_TEST(StdControlHandler, test_ep0_mps_low_speed) {
  MockDevice hw;
  TestControlHandlerCallback cb;

  StdControlHandler ctrl_handler(&cb);
  EndpointManager ep_mgr(&hw, &ctrl_handler);

  auto init_err = ep_mgr.init();
  ASEL_EXPECT_FALSE(init_err);

  // Test that endpoint 0's max packet size is reported as 8 bytes
  // when the bus is enumerated as low speed
  ep_mgr.on_suspend();
  ep_mgr.on_bus_reset();
  ep_mgr.on_enum_done(UsbSpeed::Low);
  ASEL_EXPECT_EQ(hw.out_eps[0].max_packet_size, 8);
  ASEL_EXPECT_EQ(hw.in_eps[0].max_packet_size, 8);

  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(&hw, kGetDevDescriptor, reply));
  // The descriptor map says 64, but low speed requires 8
  ASEL_EXPECT_EQ(view(reply),
                 expected_dev_descriptor(8));
}

ASEL_TEST(StdControlHandler, test_ep0_mps_full_speed) {
  MockDevice hw;
  TestControlHandlerCallback cb;

  StdControlHandler ctrl_handler(&cb);
  EndpointManager ep_mgr(&hw, &ctrl_handler);

  auto init_err = ep_mgr.init();
  ASEL_EXPECT_FALSE(init_err);

  ep_mgr.on_suspend();
  ep_mgr.on_bus_reset();
  ep_mgr.on_enum_done(UsbSpeed::Full);
  ASEL_EXPECT_EQ(hw.out_eps[0].max_packet_size, 64);
  ASEL_EXPECT_EQ(hw.in_eps[0].max_packet_size, 64);

  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(&hw, kGetDevDescriptor, reply));
  ASEL_EXPECT_EQ(view(reply),
                 expected_dev_descriptor(64));

  // A short read returns only the requested prefix of the descriptor
  auto short_read = kGetDevDescriptor;
  short_read.length = 8;
  ASEL_ASSERT_TRUE(mock_ctrl_in(&hw, short_read, reply));
  ASEL_EXPECT_EQ(reply.size(), 8);
  ASEL_EXPECT_EQ(reply[7], 64);

  // Unknown descriptors are rejected with a STALL
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      &hw,
      make_setup(0x80,
                 static_cast<uint8_t>(StdRequestType::GetDescriptor),
                 0x0600, // Device qualifier
                 0,
                 10)));
}

ASEL_TEST(StdControlHandler, setup_before_reset) {
  MockDevice hw;
  TestControlHandlerCallback cb;
  StdControlHandler ctrl_handler(&cb);
  EndpointManager ep_mgr(&hw, &ctrl_handler);
  ASEL_EXPECT_FALSE(ep_mgr.init());

  // SETUP packets are ignored until the bus has been reset and enumerated
  hw.setup_received(kGetDevDescriptor);
  ASEL_EXPECT_FALSE(hw.in_eps[0].xfer_in_progress);
  ASEL_EXPECT_FALSE(hw.in_eps[0].stalled);
}

ASEL_TEST(StdControlHandler, set_address) {
  MockDevice hw;
  TestControlHandlerCallback cb;
  StdControlHandler ctrl_handler(&cb);
  EndpointManager ep_mgr(&hw, &ctrl_handler);
  ASEL_ASSERT_TRUE(enumerate_mock_device(&hw, &ep_mgr, 42));
  ASEL_EXPECT_EQ(hw.address(), 42);
  ASEL_EXPECT_TRUE(ep_mgr.state() == DeviceState::Address);

  // SET_CONFIGURATION is rejected by this callback
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      &hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::SetConfiguration),
                 1,
                 0,
                 0)));
  ASEL_EXPECT_TRUE(ep_mgr.state() == DeviceState::Address);

  // SET_DESCRIPTOR is never supported
  const std::array<uint8_t, 4> desc_data = {{4, 3, 'x', 0}};
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      &hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::SetDescriptor),
                 0x0301,
                 0x0409,
                 4),
      asel::buf_view(desc_data.data(), desc_data.size())));

  // Setting the address back to 0 returns to the Default state
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      &hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::SetAddress),
                 0,
                 0,
                 0)));
  ASEL_EXPECT_TRUE(ep_mgr.state() == DeviceState::Default);

  // A bus reset puts the device back in the initial state
  ep_mgr.on_bus_reset();
  ASEL_EXPECT_TRUE(ep_mgr.state() == DeviceState::Uninit);
  ep_mgr.on_enum_done(UsbSpeed::Full);
  ASEL_EXPECT_TRUE(ep_mgr.state() == DeviceState::Default);
}

ASEL_TEST(StdControlHandler, device_status) {
  MockDevice hw;
  TestControlHandlerCallback cb;
  StdControlHandler ctrl_handler(&cb);
  EndpointManager ep_mgr(&hw, &ctrl_handler);
  ASEL_ASSERT_TRUE(enumerate_mock_device(&hw, &ep_mgr));

  const auto get_status = make_setup(
      0x80, static_cast<uint8_t>(StdRequestType::GetStatus), 0, 0, 2);
  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(&hw, get_status, reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{0, 0}}));

  cb.self_powered = true;
  ASEL_ASSERT_TRUE(mock_ctrl_in(&hw, get_status, reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{1, 0}}));

  // SET_FEATURE(DEVICE_REMOTE_WAKEUP)
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      &hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::SetFeature),
                 static_cast<uint16_t>(FeatureSelector::DeviceRemoteWakeup),
                 0,
                 0)));
  ASEL_EXPECT_TRUE(ep_mgr.remote_wakeup_enabled());
  ASEL_ASSERT_TRUE(mock_ctrl_in(&hw, get_status, reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{3, 0}}));

  // CLEAR_FEATURE(DEVICE_REMOTE_WAKEUP)
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      &hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::ClearFeature),
                 static_cast<uint16_t>(FeatureSelector::DeviceRemoteWakeup),
                 0,
                 0)));
  ASEL_EXPECT_FALSE(ep_mgr.remote_wakeup_enabled());

  // TEST_MODE is not supported at full speed
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      &hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::SetFeature),
                 static_cast<uint16_t>(FeatureSelector::TestMode),
                 0,
                 0)));

  // Vendor requests to the device are rejected
  ASEL_EXPECT_TRUE(
      mock_ctrl_expect_stall(&hw, make_setup(0xc0, 0x01, 0, 0, 4)));
}

namespace {
class MultiConfigDevice {
public:
  static constexpr uint8_t kConfigA = 0x12;
  static constexpr uint8_t kConfigB = 0x34;

  constexpr explicit MultiConfigDevice(EndpointManager *manager) {}

  bool set_configuration(uint8_t config_id, EndpointManager &ep_mgr) {
    if (config_id == kConfigA || config_id == kConfigB) {
      // We call set_configured() with no interfaces, even though this isn't
      // a realistic configuration
      return ep_mgr.set_configured(config_id,
                                   asel::range<Interface *const>{});
    }
    return false;
  }

  static constexpr auto make_descriptor_map() {
    DeviceDescriptor dev;
    dev.set_vendor(0x1234);
    dev.set_product(0x5678);
    dev.set_device_release(1, 0);

    auto cfg_a = ConfigDescriptor(kConfigA, ConfigAttr::RemoteWakeup);
    auto cfg_b = ConfigDescriptor(kConfigB);

    return StaticDescriptorMap()
        .add_device_descriptor(dev)
        .add_language_ids(Language::English_US)
        .add_string(dev.mfgr_str_idx(), "ACME, Inc.", Language::English_US)
        .add_string(dev.product_str_idx(), "usbpad Test Device",
                    Language::English_US)
        .add_string(dev.serial_str_idx(), "00:00:00::00:00:00",
                    Language::English_US)
        .add_config_descriptor(cfg_a)
        .add_config_descriptor(cfg_b);
  }
};
} // namespace

ASEL_TEST(StdControlHandler, multi_config) {
  UsbDevice<MultiConfigDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));

  // Make a GET_CONFIGURATION request
  uint8_t cfg_id;
  mock_send_get_config(usb, cfg_id);
  // The currently selected config should be ConfigA
  ASEL_EXPECT_EQ(cfg_id, 0x12);

  // Send a SET_CONFIGURATION request to switch to ConfigB
  mock_send_set_config(usb, 0x34);

  // GET_CONFIGURATION should now return ConfigB's ID
  mock_send_get_config(usb, cfg_id);
  ASEL_EXPECT_EQ(cfg_id, 0x34);

  // Send a SET_CONFIGURATION request to unconfigure the device
  mock_send_set_config(usb, 0);

  mock_send_get_config(usb, cfg_id);
  ASEL_EXPECT_EQ(cfg_id, 0);
  ASEL_EXPECT_TRUE(usb.manager()->state() == DeviceState::Address);

  // A SET_CONFIGURATION request with a bogus ID should fail and result in a
  // STALL
  auto *const hw = usb.hw();
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      make_setup(0x00,
                 static_cast<uint8_t>(StdRequestType::SetConfiguration),
                 0x78,
                 0,
                 0)));

  // GET_CONFIGURATION should still return config ID 0 now
  cfg_id = 0xff;
  mock_send_get_config(usb, cfg_id);
  ASEL_EXPECT_EQ(cfg_id, 0);
}

ASEL_TEST(StdControlHandler, endpoint_halt) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();

  const auto get_ep_status = [](uint8_t address) {
    return make_setup(0x82, // IN, Endpoint, Standard request
                      static_cast<uint8_t>(StdRequestType::GetStatus),
                      0,
                      address,
                      2);
  };
  const auto halt_req = [](bool set, uint8_t address) {
    return make_setup(0x02, // OUT, Endpoint, Standard request
                      static_cast<uint8_t>(set ? StdRequestType::SetFeature
                                               : StdRequestType::ClearFeature),
                      static_cast<uint16_t>(FeatureSelector::EndpointHalt),
                      address,
                      0);
  };

  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_ep_status(0x81), reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{0, 0}}));

  ASEL_EXPECT_TRUE(mock_ctrl_out(hw, halt_req(true, 0x81)));
  ASEL_EXPECT_TRUE(hw->in_eps[1].stalled);
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_ep_status(0x81), reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{1, 0}}));

  ASEL_EXPECT_TRUE(mock_ctrl_out(hw, halt_req(false, 0x81)));
  ASEL_EXPECT_FALSE(hw->in_eps[1].stalled);
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_ep_status(0x81), reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{0, 0}}));

  // Endpoint 0 is never reported as halted
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_ep_status(0x00), reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{0, 0}}));
  ASEL_EXPECT_TRUE(mock_ctrl_out(hw, halt_req(false, 0x00)));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(hw, halt_req(true, 0x00)));

  // Endpoints that are not part of the configuration
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(hw, get_ep_status(0x01)));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(hw, get_ep_status(0x82)));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(hw, halt_req(true, 0x02)));

  // Halt state is cleared when the configuration changes
  ASEL_EXPECT_TRUE(mock_ctrl_out(hw, halt_req(true, 0x81)));
  ASEL_EXPECT_TRUE(mock_send_set_config(usb, GamepadTestDevice::kConfigId));
  ASEL_ASSERT_TRUE(mock_ctrl_in(hw, get_ep_status(0x81), reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{0, 0}}));
}

ASEL_TEST(StdControlHandler, interface_requests) {
  UsbDevice<GamepadTestDevice, MockDevice> usb;
  ASEL_ASSERT_TRUE(attach_mock_device(usb));
  auto *const hw = usb.hw();

  std::vector<uint8_t> reply;
  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      make_setup(0x81, // IN, Interface, Standard request
                 static_cast<uint8_t>(StdRequestType::GetInterface),
                 0,
                 0,
                 1),
      reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 1>{{0}}));

  ASEL_ASSERT_TRUE(mock_ctrl_in(
      hw,
      make_setup(0x81,
                 static_cast<uint8_t>(StdRequestType::GetStatus),
                 0,
                 0,
                 2),
      reply));
  ASEL_EXPECT_EQ(view(reply), (std::array<uint8_t, 2>{{0, 0}}));

  // Alternate setting 0 is accepted, anything else is not
  ASEL_EXPECT_TRUE(mock_ctrl_out(
      hw,
      make_setup(0x01, // OUT, Interface, Standard request
                 static_cast<uint8_t>(StdRequestType::SetInterface),
                 0,
                 0,
                 0)));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      make_setup(0x01,
                 static_cast<uint8_t>(StdRequestType::SetInterface),
                 1,
                 0,
                 0)));

  // Requests to interfaces that don't exist
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      make_setup(0x81,
                 static_cast<uint8_t>(StdRequestType::GetInterface),
                 0,
                 1,
                 1)));

  // Interfaces only exist while the device is configured
  ASEL_EXPECT_TRUE(mock_send_set_config(usb, 0));
  ASEL_EXPECT_TRUE(mock_ctrl_expect_stall(
      hw,
      make_setup(0x81,
                 static_cast<uint8_t>(StdRequestType::GetInterface),
                 0,
                 0,
                 1)));
}

} // namespace usbpad::test
