/**
 * @file test_controller.cpp
 * @brief Tests for fluff/controller.hpp - the application facade.
 */

#include "fluff/controller.hpp"

#include <catch2/catch_test_macros.hpp>

#include "mock_transport.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

using fluff::ControlError;
using fluff::Endpoint;
using fluff_test::MockTransport;
using fluff_test::WaitUntil;

using Ctl = fluff::Controller<MockTransport>;

namespace {

fluff::SessionOptions NoKeepalive() {
  fluff::SessionOptions o;
  o.keepalive_interval_ms = 0U;
  return o;
}

void ConnectOrFail(Ctl& ctl) {
  fluff::ConnectOptions c;
  c.retries = 1U;
  c.retry_delay_ms = 0U;
  REQUIRE(ctl.ConnectAddress("AA:BB:CC:DD:EE:FF", c).has_value());
}

}  // namespace

TEST_CASE("Controller: behavior commands reach the behavior endpoint",
          "[controller]") {
  MockTransport t;
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);

  REQUIRE(ctl.TriggerBehavior(55, 2, 14, 0).has_value());
  REQUIRE(ctl.SetIndicatorColor(255, 0, 16).has_value());
  REQUIRE(ctl.SetLcdBacklight(true).has_value());
  REQUIRE(ctl.CycleDebugMenu().has_value());

  auto gp = t.WritesTo(Endpoint::kGeneralPlusWrite);
  REQUIRE(gp.size() == 4U);
  REQUIRE(gp[0].bytes ==
          std::vector<uint8_t>{0x13, 0x00, 0x37, 0x02, 0x0E, 0x00});
  REQUIRE(gp[1].bytes == std::vector<uint8_t>{0x14, 0xFF, 0x00, 0x10});
  REQUIRE(gp[2].bytes == std::vector<uint8_t>{0xCD, 0x01});
  REQUIRE(gp[3].bytes == std::vector<uint8_t>{0xDB});
}

TEST_CASE("Controller: SetName also speaks the name", "[controller]") {
  MockTransport t;
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);

  REQUIRE(ctl.SetName(5).has_value());
  auto gp = t.WritesTo(Endpoint::kGeneralPlusWrite);
  REQUIRE(gp.size() == 2U);
  REQUIRE(gp[0].bytes == std::vector<uint8_t>{0x21, 0x05});
  REQUIRE(gp[1].bytes ==
          std::vector<uint8_t>{0x13, 0x00, 0x21, 0x00, 0x00, 0x05});
}

TEST_CASE("Controller: mood set and add", "[controller]") {
  MockTransport t;
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);

  REQUIRE(ctl.SetMood(fluff::MoodType::kTiredness, 80).has_value());
  REQUIRE(ctl.SetMood(fluff::MoodType::kFullness, 10, false).has_value());
  auto gp = t.WritesTo(Endpoint::kGeneralPlusWrite);
  REQUIRE(gp.size() == 2U);
  REQUIRE(gp[0].bytes == std::vector<uint8_t>{0x24, 0x01, 0x02, 0x50});
  REQUIRE(gp[1].bytes == std::vector<uint8_t>{0x24, 0x00, 0x03, 0x0A});
}

TEST_CASE("Controller: invalid arguments never reach the link",
          "[controller]") {
  MockTransport t;
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);

  auto color = ctl.SetIndicatorColor(256, 0, 0);
  REQUIRE_FALSE(color.has_value());
  REQUIRE(color.get_error() == ControlError::kInvalidCommand);

  auto mood = ctl.SetMood(fluff::MoodType::kWellness, 101);
  REQUIRE_FALSE(mood.has_value());
  REQUIRE(mood.get_error() == ControlError::kInvalidCommand);

  auto name = ctl.SetName(-1);
  REQUIRE_FALSE(name.has_value());
  REQUIRE(name.get_error() == ControlError::kInvalidCommand);

  REQUIRE(t.Writes().empty());
}

TEST_CASE("Controller: commands need a connection", "[controller]") {
  MockTransport t;
  Ctl ctl(t, NoKeepalive());
  auto r = ctl.TriggerBehavior(1, 0, 0, 0);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ControlError::kNotConnected);
  REQUIRE_FALSE(ctl.IsConnected());
}

namespace {

struct EventSink {
  std::atomic<uint32_t> count{0};
  std::atomic<uint8_t> last_tag{0};

  static void OnEvent(const fluff::NotificationEvent& ev, void* ctx) {
    auto* self = static_cast<EventSink*>(ctx);
    self->last_tag = ev.tag;
    self->count.fetch_add(1U);
  }
};

}  // namespace

TEST_CASE("Controller: notifications flow to subscribers", "[controller]") {
  MockTransport t;
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);

  EventSink sink;
  auto sub = ctl.Subscribe(fluff::Channel::kBehavior, &EventSink::OnEvent,
                           &sink);
  REQUIRE(sub.has_value());
  REQUIRE(t.Inject(Endpoint::kGeneralPlusListen, {0x20, 0x13}));
  REQUIRE(WaitUntil([&]() { return sink.count.load() == 1U; }));
  REQUIRE(sink.last_tag.load() == 0x20);

  REQUIRE(ctl.Unsubscribe(sub.value()));
  REQUIRE(t.Inject(Endpoint::kGeneralPlusListen, {0x20, 0x13}));
  fluff::SleepMs(30U);
  REQUIRE(sink.count.load() == 1U);
}

TEST_CASE("Controller: upload through the facade", "[controller]") {
  MockTransport t;
  t.device_enabled = true;
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);

  std::vector<uint8_t> data(47U, 0x5A);
  fluff::UploadOptions o;
  o.chunk_delay_ms = 0U;
  o.activate = true;
  auto id = ctl.StartUpload(2U, data.data(), 47U, o);
  REQUIRE(id.has_value());
  auto job = ctl.WaitForJob(id.value(), 5000U);
  REQUIRE(job.has_value());
  REQUIRE(job.value().state == fluff::JobState::kActive);
  REQUIRE(t.BulkBytes() == 47U);

  REQUIRE(ctl.Disconnect().has_value());
  REQUIRE(ctl.State() == fluff::SessionState::kDisconnected);
}

TEST_CASE("Controller: device info through the facade", "[controller]") {
  MockTransport t;
  t.SetReadValue(Endpoint::kFirmwareRevision, "2.1.0.7");
  Ctl ctl(t, NoKeepalive());
  ConnectOrFail(ctl);
  auto info = ctl.ReadDeviceInfo();
  REQUIRE(info.has_value());
  REQUIRE(info.value().fields_read == 1U);
  REQUIRE(info.value().firmware_revision == "2.1.0.7");
}
