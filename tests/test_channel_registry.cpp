/**
 * @file test_channel_registry.cpp
 * @brief Tests for fluff/channel_registry.hpp - binding, fan-out, writes.
 */

#include "fluff/channel_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include "mock_transport.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

using fluff::Channel;
using fluff::Endpoint;
using fluff::EventType;
using fluff_test::MockTransport;
using fluff_test::WaitUntil;

using Registry = fluff::ChannelRegistry<MockTransport>;

namespace {

struct Recorder {
  std::mutex mtx;
  std::vector<fluff::NotificationEvent> events;

  static void OnEvent(const fluff::NotificationEvent& ev, void* ctx) {
    auto* self = static_cast<Recorder*>(ctx);
    std::lock_guard<std::mutex> lock(self->mtx);
    self->events.push_back(ev);
  }

  size_t Count() {
    std::lock_guard<std::mutex> lock(mtx);
    return events.size();
  }

  fluff::NotificationEvent At(size_t i) {
    std::lock_guard<std::mutex> lock(mtx);
    return events.at(i);
  }
};

struct WriteErrorSpy {
  std::atomic<uint32_t> calls{0};
  Channel last_channel = Channel::kBehavior;

  static void OnWriteError(Channel ch, fluff::TransportError, void* ctx) {
    auto* self = static_cast<WriteErrorSpy*>(ctx);
    self->last_channel = ch;
    self->calls.fetch_add(1U);
  }
};

void ConnectMock(MockTransport& t) {
  REQUIRE(t.Connect("AA:BB:CC:DD:EE:FF", 1000U).has_value());
}

}  // namespace

// ============================================================================
// Attach / Detach
// ============================================================================

TEST_CASE("ChannelRegistry: attach subscribes notify endpoints", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  REQUIRE_FALSE(reg.IsAttached());
  REQUIRE(reg.Attach().has_value());
  REQUIRE(reg.IsAttached());
  REQUIRE(t.HasSubscriber(Endpoint::kGeneralPlusListen));
  REQUIRE(t.HasSubscriber(Endpoint::kNordicListen));
  REQUIRE(t.HasSubscriber(Endpoint::kRssiListen));

  reg.Detach();
  REQUIRE_FALSE(reg.IsAttached());
  REQUIRE_FALSE(t.HasSubscriber(Endpoint::kGeneralPlusListen));
  REQUIRE_FALSE(t.HasSubscriber(Endpoint::kNordicListen));
  reg.Detach();
}

TEST_CASE("ChannelRegistry: failed attach releases earlier endpoints",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  t.fail_subscribe_endpoint = static_cast<uint32_t>(Endpoint::kNordicListen);
  Registry reg(t);
  auto r = reg.Attach();
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == fluff::TransportError::kSubscribeFailed);
  REQUIRE_FALSE(reg.IsAttached());
  REQUIRE_FALSE(t.HasSubscriber(Endpoint::kGeneralPlusListen));
}

// ============================================================================
// Outbound
// ============================================================================

TEST_CASE("ChannelRegistry: issue routes by command channel", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  REQUIRE(reg.Attach().has_value());

  REQUIRE(reg.Issue(fluff::MakeSetIndicatorColor(255, 0, 0).value()).has_value());
  REQUIRE(reg.Issue(fluff::MakeEnableTransferAck(true).value()).has_value());

  auto gp = t.WritesTo(Endpoint::kGeneralPlusWrite);
  REQUIRE(gp.size() == 1U);
  REQUIRE(gp[0].bytes == std::vector<uint8_t>{0x14, 0xFF, 0x00, 0x00});
  auto nordic = t.WritesTo(Endpoint::kNordicWrite);
  REQUIRE(nordic.size() == 1U);
  REQUIRE(nordic[0].bytes == std::vector<uint8_t>{0x09, 0x01, 0x00});
}

TEST_CASE("ChannelRegistry: bulk publish is verbatim", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  REQUIRE(reg.Attach().has_value());
  const uint8_t chunk[] = {0x50, 0x01, 0x02, 0x03};
  REQUIRE(reg.Publish(Channel::kBulk, chunk, sizeof(chunk)).has_value());
  auto bulk = t.WritesTo(Endpoint::kFileWrite);
  REQUIRE(bulk.size() == 1U);
  REQUIRE(bulk[0].bytes == std::vector<uint8_t>(chunk, chunk + sizeof(chunk)));
}

TEST_CASE("ChannelRegistry: publish errors", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  const uint8_t b[] = {0x00};

  auto detached = reg.Publish(Channel::kBehavior, b, 1U);
  REQUIRE_FALSE(detached.has_value());
  REQUIRE(detached.get_error() == fluff::RegistryError::kNotConnected);

  REQUIRE(reg.Attach().has_value());
  auto signal = reg.Publish(Channel::kSignal, b, 1U);
  REQUIRE_FALSE(signal.has_value());
  REQUIRE(signal.get_error() == fluff::RegistryError::kNotWritable);

  auto empty = reg.Publish(Channel::kBehavior, b, 0U);
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.get_error() == fluff::RegistryError::kInvalidArgument);
}

TEST_CASE("ChannelRegistry: write failure fires hook", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  WriteErrorSpy spy;
  reg.SetWriteErrorHook(&WriteErrorSpy::OnWriteError, &spy);
  REQUIRE(reg.Attach().has_value());

  t.fail_writes = true;
  auto r = reg.Issue(fluff::MakeKeepAlive().value());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == fluff::RegistryError::kWriteFailed);
  REQUIRE(spy.calls.load() == 1U);
  REQUIRE(spy.last_channel == Channel::kBehavior);
  REQUIRE(reg.WriteFailureCount() == 1U);
}

// ============================================================================
// Inbound fan-out
// ============================================================================

TEST_CASE("ChannelRegistry: every subscriber of a channel gets the event",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder a;
  Recorder b;
  Recorder other;
  REQUIRE(reg.Subscribe(Channel::kControl, &Recorder::OnEvent, &a).has_value());
  REQUIRE(reg.Subscribe(Channel::kControl, &Recorder::OnEvent, &b).has_value());
  REQUIRE(reg.Subscribe(Channel::kBehavior, &Recorder::OnEvent, &other)
              .has_value());
  REQUIRE(reg.Attach().has_value());

  REQUIRE(t.Inject(Endpoint::kNordicListen, {0x09, 0x03}));
  REQUIRE(WaitUntil([&]() { return a.Count() == 1U && b.Count() == 1U; }));
  REQUIRE(a.At(0).type == EventType::kTransferAck);
  REQUIRE(a.At(0).value == 3U);
  REQUIRE(b.At(0) == a.At(0));
  REQUIRE(other.Count() == 0U);
}

TEST_CASE("ChannelRegistry: subscribe-all sees every channel", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder all;
  REQUIRE(reg.SubscribeAll(&Recorder::OnEvent, &all).has_value());
  REQUIRE(reg.Attach().has_value());

  REQUIRE(t.Inject(Endpoint::kGeneralPlusListen, {0x20, 0x06}));
  REQUIRE(t.Inject(Endpoint::kNordicListen, {0x0A}));
  REQUIRE(t.Inject(Endpoint::kRssiListen, {0xC0}));
  REQUIRE(WaitUntil([&]() { return all.Count() == 3U; }));
}

TEST_CASE("ChannelRegistry: events on one channel keep arrival order",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder rec;
  REQUIRE(reg.Subscribe(Channel::kControl, &Recorder::OnEvent, &rec)
              .has_value());
  REQUIRE(reg.Attach().has_value());
  for (uint8_t i = 1; i <= 10; ++i) {
    REQUIRE(t.Inject(Endpoint::kNordicListen, {0x09, i}));
  }
  REQUIRE(WaitUntil([&]() { return rec.Count() == 10U; }));
  for (size_t i = 0; i < 10; ++i) {
    REQUIRE(rec.At(i).value == static_cast<uint8_t>(i + 1U));
  }
}

TEST_CASE("ChannelRegistry: unknown and undecodable frames pass through raw",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder rec;
  REQUIRE(reg.SubscribeAll(&Recorder::OnEvent, &rec).has_value());
  REQUIRE(reg.Attach().has_value());

  REQUIRE(t.Inject(Endpoint::kGeneralPlusListen, {0x77, 0x01}));
  REQUIRE(t.Inject(Endpoint::kNordicListen, {0x01, 0x02}));
  REQUIRE(WaitUntil([&]() { return rec.Count() == 2U; }));

  auto unknown = rec.At(0);
  REQUIRE(unknown.type == EventType::kRaw);
  REQUIRE(unknown.tag == 0x77);
  REQUIRE_FALSE(unknown.decode_error);

  auto truncated = rec.At(1);
  REQUIRE(truncated.type == EventType::kRaw);
  REQUIRE(truncated.decode_error);
  REQUIRE(truncated.tag == 0x01);
  REQUIRE(reg.DecodeErrorCount() == 1U);
}

TEST_CASE("ChannelRegistry: oversized notification forwarded truncated",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder rec;
  REQUIRE(reg.Subscribe(Channel::kBehavior, &Recorder::OnEvent, &rec)
              .has_value());
  REQUIRE(reg.Attach().has_value());

  std::vector<uint8_t> big(fluff::kMaxFrameSize + 8U, 0x5A);
  big[0] = 0x77;
  REQUIRE(t.Inject(Endpoint::kGeneralPlusListen, big));
  REQUIRE(WaitUntil([&]() { return rec.Count() == 1U; }));

  auto ev = rec.At(0);
  REQUIRE(ev.type == EventType::kRaw);
  REQUIRE(ev.decode_error);
  REQUIRE(ev.tag == 0x77);
  REQUIRE(ev.payload.size() == fluff::kMaxFrameSize - 1U);
  REQUIRE(ev.payload.bytes[0] == 0x5A);
  REQUIRE(reg.TruncatedCount() == 1U);
  REQUIRE(reg.DecodeErrorCount() == 1U);
  REQUIRE(reg.DroppedCount() == 0U);
}

TEST_CASE("ChannelRegistry: concurrent producers on one channel",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder rec;
  REQUIRE(reg.Subscribe(Channel::kSignal, &Recorder::OnEvent, &rec)
              .has_value());
  REQUIRE(reg.Attach().has_value());

  constexpr uint32_t kPerThread = 200U;
  auto produce = [&](uint8_t marker) {
    for (uint32_t i = 0; i < kPerThread; ++i) {
      (void)t.InjectUnlocked(Endpoint::kRssiListen,
                             {marker, static_cast<uint8_t>(i), marker});
      if (i % 16U == 15U) fluff::SleepMs(1U);
    }
  };
  std::thread a(produce, static_cast<uint8_t>(0xA1));
  std::thread b(produce, static_cast<uint8_t>(0xB2));
  a.join();
  b.join();

  REQUIRE(WaitUntil([&]() {
    return rec.Count() + reg.DroppedCount() == 2U * kPerThread;
  }));
  std::lock_guard<std::mutex> lock(rec.mtx);
  for (const auto& ev : rec.events) {
    REQUIRE(ev.payload.size() == 3U);
    REQUIRE(ev.payload.bytes[0] == ev.payload.bytes[2]);
    const bool known = ev.payload.bytes[0] == 0xA1 || ev.payload.bytes[0] == 0xB2;
    REQUIRE(known);
  }
}

TEST_CASE("ChannelRegistry: unsubscribed consumer stops receiving",
          "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder keep;
  Recorder drop;
  REQUIRE(reg.Subscribe(Channel::kControl, &Recorder::OnEvent, &keep)
              .has_value());
  auto id = reg.Subscribe(Channel::kControl, &Recorder::OnEvent, &drop);
  REQUIRE(id.has_value());
  REQUIRE(reg.SubscriberCount() == 2U);
  REQUIRE(reg.Attach().has_value());

  REQUIRE(reg.Unsubscribe(id.value()));
  REQUIRE_FALSE(reg.Unsubscribe(id.value()));
  REQUIRE(reg.SubscriberCount() == 1U);

  REQUIRE(t.Inject(Endpoint::kNordicListen, {0x09, 0x01}));
  REQUIRE(WaitUntil([&]() { return keep.Count() == 1U; }));
  REQUIRE(drop.Count() == 0U);
}

TEST_CASE("ChannelRegistry: subscriptions survive reattach", "[registry]") {
  MockTransport t;
  ConnectMock(t);
  Registry reg(t);
  Recorder rec;
  REQUIRE(reg.Subscribe(Channel::kBehavior, &Recorder::OnEvent, &rec)
              .has_value());
  REQUIRE(reg.Attach().has_value());
  reg.Detach();
  REQUIRE(reg.Attach().has_value());
  REQUIRE(t.Inject(Endpoint::kGeneralPlusListen, {0x24, 0x02}));
  REQUIRE(WaitUntil([&]() { return rec.Count() == 1U; }));
  REQUIRE(rec.At(0).type == EventType::kTransferStatus);
}

TEST_CASE("ChannelRegistry: null callback rejected", "[registry]") {
  MockTransport t;
  Registry reg(t);
  auto r = reg.Subscribe(Channel::kBehavior, nullptr, nullptr);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == fluff::RegistryError::kInvalidArgument);
}
