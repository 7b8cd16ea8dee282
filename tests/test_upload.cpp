/**
 * @file test_upload.cpp
 * @brief Tests for fluff/upload.hpp - chunked transfer, liveness and
 *        backpressure against a simulated device.
 */

#include "fluff/upload.hpp"

#include <catch2/catch_test_macros.hpp>

#include "mock_transport.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

using fluff::Endpoint;
using fluff::JobState;
using fluff::SlotState;
using fluff::UploadError;
using fluff::UploadOptions;
using fluff_test::MockTransport;
using fluff_test::WaitUntil;

using Session = fluff::SessionManager<MockTransport>;
using Uploader = fluff::UploadController<MockTransport>;

namespace {

constexpr uint32_t kJobWaitMs = 5000U;

struct Rig {
  MockTransport transport;
  Session session;
  Uploader uploads;

  Rig() : session(transport, QuietSession()), uploads(session) {
    transport.device_enabled = true;
    fluff::ConnectOptions c;
    c.retries = 1U;
    c.retry_delay_ms = 0U;
    REQUIRE(session.ConnectAddress("AA:BB:CC:DD:EE:FF", c).has_value());
  }

  static fluff::SessionOptions QuietSession() {
    fluff::SessionOptions o;
    o.keepalive_interval_ms = 0U;
    return o;
  }
};

UploadOptions FastOptions() {
  UploadOptions o;
  o.chunk_delay_ms = 0U;
  o.ready_timeout_ms = 1000U;
  o.stall_timeout_ms = 1000U;
  o.completion_timeout_ms = 1000U;
  o.overload_delay_ms = 10U;
  return o;
}

std::vector<uint8_t> Payload(uint32_t n) {
  std::vector<uint8_t> v(n);
  for (uint32_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>(i * 7U + 1U);
  return v;
}

fluff::UploadJob RunToEnd(Uploader& up, fluff::JobId id) {
  auto job = up.WaitForJob(id, kJobWaitMs);
  REQUIRE(job.has_value());
  REQUIRE(job.value().finished);
  return job.value();
}

}  // namespace

// ============================================================================
// Chunking
// ============================================================================

TEST_CASE("Upload: chunk arithmetic", "[upload]") {
  REQUIRE(fluff::ChunkCount(47U) == 3U);
  REQUIRE(fluff::ChunkCount(40U) == 2U);
  REQUIRE(fluff::ChunkCount(1U) == 1U);
  REQUIRE(fluff::ChunkLength(47U, 0U) == 20U);
  REQUIRE(fluff::ChunkLength(47U, 2U) == 7U);
  REQUIRE(fluff::ChunkLength(40U, 1U) == 20U);
  REQUIRE(fluff::ChunkLength(40U, 2U) == 0U);
}

TEST_CASE("Upload: 47 bytes go out as 20, 20 and 7", "[upload]") {
  Rig rig;
  const auto data = Payload(47U);
  auto id = rig.uploads.StartUpload(2U, data.data(), 47U, FastOptions());
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());

  REQUIRE(job.state == JobState::kDownloaded);
  REQUIRE_FALSE(job.has_error);
  REQUIRE(job.bytes_sent == 47U);
  REQUIRE(job.chunks_sent == 3U);
  REQUIRE(job.chunks_total == 3U);
  REQUIRE(job.chunks_acked <= 3U);
  REQUIRE(job.predicted_slot_state == SlotState::kDownloaded);

  auto bulk = rig.transport.WritesTo(Endpoint::kFileWrite);
  REQUIRE(bulk.size() == 3U);
  REQUIRE(bulk[0].bytes.size() == 20U);
  REQUIRE(bulk[1].bytes.size() == 20U);
  REQUIRE(bulk[2].bytes.size() == 7U);
  std::vector<uint8_t> joined;
  for (const auto& w : bulk) {
    joined.insert(joined.end(), w.bytes.begin(), w.bytes.end());
  }
  REQUIRE(joined == data);
}

TEST_CASE("Upload: ack enable and announce precede the chunks", "[upload]") {
  Rig rig;
  const auto data = Payload(47U);
  auto id = rig.uploads.StartUpload(2U, data.data(), 47U, FastOptions());
  REQUIRE(id.has_value());
  (void)RunToEnd(rig.uploads, id.value());

  auto all = rig.transport.Writes();
  REQUIRE(all.size() >= 5U);
  REQUIRE(all[0].endpoint == Endpoint::kNordicWrite);
  REQUIRE(all[0].bytes == std::vector<uint8_t>{0x09, 0x01, 0x00});
  REQUIRE(all[1].endpoint == Endpoint::kGeneralPlusWrite);
  REQUIRE(all[1].bytes.size() == 20U);
  REQUIRE(all[1].bytes[0] == 0x50);
  REQUIRE(all[1].bytes[4] == 47U);
  REQUIRE(all[1].bytes[5] == 2U);
  REQUIRE(all[2].endpoint == Endpoint::kFileWrite);
}

TEST_CASE("Upload: acks can be left disabled", "[upload]") {
  Rig rig;
  const auto data = Payload(30U);
  UploadOptions o = FastOptions();
  o.enable_ack = false;
  auto id = rig.uploads.StartUpload(1U, data.data(), 30U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kDownloaded);
  REQUIRE(rig.transport.WritesTo(Endpoint::kNordicWrite).empty());
}

TEST_CASE("Upload: activate loads and activates the slot", "[upload]") {
  Rig rig;
  const auto data = Payload(25U);
  UploadOptions o = FastOptions();
  o.activate = true;
  auto id = rig.uploads.StartUpload(4U, data.data(), 25U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());

  REQUIRE(job.state == JobState::kActive);
  REQUIRE(rig.uploads.PredictedSlotState(4U) == SlotState::kActive);
  auto gp = rig.transport.WritesTo(Endpoint::kGeneralPlusWrite);
  REQUIRE(gp.size() == 3U);
  REQUIRE(gp[1].bytes == std::vector<uint8_t>{0x60, 0x04});
  REQUIRE(gp[2].bytes == std::vector<uint8_t>{0x61});
}

// ============================================================================
// Liveness and backpressure
// ============================================================================

TEST_CASE("Upload: missing acks stall the job and halt emission",
          "[upload]") {
  Rig rig;
  rig.transport.stop_acks_after = 1U;
  rig.transport.complete_reply = 0U;
  const auto data = Payload(200U);
  UploadOptions o = FastOptions();
  o.chunk_delay_ms = 20U;
  o.stall_timeout_ms = 50U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 200U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());

  REQUIRE(job.state == JobState::kStalled);
  REQUIRE(job.has_error);
  REQUIRE(job.error == UploadError::kStalled);
  REQUIRE(job.chunks_sent < 10U);

  const uint32_t sent = rig.transport.BulkChunks();
  fluff::SleepMs(60U);
  REQUIRE(rig.transport.BulkChunks() == sent);
  REQUIRE(rig.session.IsConnected());
}

TEST_CASE("Upload: in-flight window waits for acks", "[upload]") {
  Rig rig;
  rig.transport.ack_every = 0U;
  rig.transport.complete_reply = 0U;
  const auto data = Payload(100U);
  UploadOptions o = FastOptions();
  o.max_unacked_chunks = 2U;
  o.stall_timeout_ms = 80U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 100U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());

  REQUIRE(job.state == JobState::kStalled);
  REQUIRE(rig.transport.BulkChunks() == 2U);
}

TEST_CASE("Upload: window with prompt acks completes", "[upload]") {
  Rig rig;
  const auto data = Payload(100U);
  UploadOptions o = FastOptions();
  o.max_unacked_chunks = 1U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 100U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kDownloaded);
  REQUIRE(job.chunks_acked >= 4U);
}

TEST_CASE("Upload: overload pauses without failing", "[upload]") {
  Rig rig;
  rig.transport.overload_at = 1U;
  const auto data = Payload(60U);
  UploadOptions o = FastOptions();
  o.overload_delay_ms = 100U;
  o.chunk_delay_ms = 20U;
  const uint64_t start = fluff::SteadyNowUs();
  auto id = rig.uploads.StartUpload(2U, data.data(), 60U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());

  REQUIRE(job.state == JobState::kDownloaded);
  REQUIRE(job.overloads == 1U);
  REQUIRE(fluff::SteadyNowUs() - start >= 100000U);
}

// ============================================================================
// Cancellation and failures
// ============================================================================

TEST_CASE("Upload: cancel stops chunks and keeps the link", "[upload]") {
  Rig rig;
  const auto data = Payload(2000U);
  UploadOptions o = FastOptions();
  o.chunk_delay_ms = 10U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 2000U, o);
  REQUIRE(id.has_value());
  REQUIRE(WaitUntil([&]() { return rig.transport.BulkChunks() >= 2U; }));

  REQUIRE(rig.uploads.CancelUpload(id.value()).has_value());
  auto job = rig.uploads.GetJob(id.value());
  REQUIRE(job.has_value());
  REQUIRE(job.value().finished);
  REQUIRE(job.value().state == JobState::kAborted);
  REQUIRE(job.value().error == UploadError::kCancelled);

  const uint32_t sent = rig.transport.BulkChunks();
  REQUIRE(sent < 100U);
  fluff::SleepMs(30U);
  REQUIRE(rig.transport.BulkChunks() == sent);
  REQUIRE(rig.session.IsConnected());
  REQUIRE_FALSE(rig.uploads.IsBusy());
}

TEST_CASE("Upload: session loss aborts the job", "[upload]") {
  Rig rig;
  const auto data = Payload(2000U);
  UploadOptions o = FastOptions();
  o.chunk_delay_ms = 10U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 2000U, o);
  REQUIRE(id.has_value());
  REQUIRE(WaitUntil([&]() { return rig.transport.BulkChunks() >= 2U; }));

  REQUIRE(rig.session.Disconnect().has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kAborted);
  REQUIRE(job.error == UploadError::kLinkLost);
}

TEST_CASE("Upload: chunk write failure aborts the job", "[upload]") {
  Rig rig;
  rig.transport.fail_bulk_after = 2U;
  const auto data = Payload(100U);
  auto id = rig.uploads.StartUpload(2U, data.data(), 100U, FastOptions());
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());

  REQUIRE(job.state == JobState::kAborted);
  REQUIRE(job.error == UploadError::kWriteFailed);
  REQUIRE(job.chunks_sent == 2U);
  REQUIRE(rig.session.State() == fluff::SessionState::kConnected);

  auto follow_up = rig.session.Channels().Issue(
      fluff::MakeSetIndicatorColor(0, 255, 0).value());
  REQUIRE(follow_up.has_value());
}

TEST_CASE("Upload: occupied slot aborts before any chunk", "[upload]") {
  Rig rig;
  rig.transport.announce_reply = 1U;
  const auto data = Payload(40U);
  auto id = rig.uploads.StartUpload(2U, data.data(), 40U, FastOptions());
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kAborted);
  REQUIRE(job.error == UploadError::kSlotOccupied);
  REQUIRE(rig.transport.BulkChunks() == 0U);
}

TEST_CASE("Upload: silent device is not ready", "[upload]") {
  Rig rig;
  rig.transport.announce_reply = 0U;
  const auto data = Payload(40U);
  UploadOptions o = FastOptions();
  o.ready_timeout_ms = 50U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 40U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kAborted);
  REQUIRE(job.error == UploadError::kDeviceNotReady);
}

TEST_CASE("Upload: ready wait can be skipped", "[upload]") {
  Rig rig;
  rig.transport.announce_reply = 0U;
  const auto data = Payload(40U);
  UploadOptions o = FastOptions();
  o.ready_timeout_ms = 0U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 40U, o);
  REQUIRE(id.has_value());
  REQUIRE(RunToEnd(rig.uploads, id.value()).state == JobState::kDownloaded);
}

TEST_CASE("Upload: device receive error", "[upload]") {
  Rig rig;
  rig.transport.complete_reply = 6U;
  const auto data = Payload(40U);
  auto id = rig.uploads.StartUpload(2U, data.data(), 40U, FastOptions());
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kAborted);
  REQUIRE(job.error == UploadError::kDeviceRejected);
}

TEST_CASE("Upload: slot report confirms the download", "[upload]") {
  Rig rig;
  rig.transport.complete_reply = 0U;
  rig.transport.report_slot_downloaded = true;
  const auto data = Payload(40U);
  auto id = rig.uploads.StartUpload(3U, data.data(), 40U, FastOptions());
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kDownloaded);
  auto observed = rig.uploads.ObservedSlotState(3U);
  REQUIRE(observed.has_value());
  REQUIRE(observed.value() == SlotState::kDownloaded);
}

TEST_CASE("Upload: no confirmation times out as stalled", "[upload]") {
  Rig rig;
  rig.transport.complete_reply = 0U;
  const auto data = Payload(40U);
  UploadOptions o = FastOptions();
  o.completion_timeout_ms = 50U;
  auto id = rig.uploads.StartUpload(2U, data.data(), 40U, o);
  REQUIRE(id.has_value());
  auto job = RunToEnd(rig.uploads, id.value());
  REQUIRE(job.state == JobState::kStalled);
  REQUIRE(job.error == UploadError::kCompletionTimeout);
}

// ============================================================================
// Preconditions
// ============================================================================

TEST_CASE("Upload: requires a connected session", "[upload]") {
  MockTransport t;
  Session s(t);
  Uploader up(s);
  const auto data = Payload(10U);
  auto r = up.StartUpload(2U, data.data(), 10U);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == UploadError::kNotConnected);
}

TEST_CASE("Upload: argument validation", "[upload]") {
  Rig rig;
  const auto data = Payload(10U);
  auto empty = rig.uploads.StartUpload(2U, data.data(), 0U);
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.get_error() == UploadError::kInvalidArgument);

  UploadOptions o = FastOptions();
  o.filename.assign(fluff::TruncateToCapacity, "A\nB");
  auto bad_name = rig.uploads.StartUpload(2U, data.data(), 10U, o);
  REQUIRE_FALSE(bad_name.has_value());
  REQUIRE(bad_name.get_error() == UploadError::kInvalidArgument);
  REQUIRE(rig.transport.Writes().empty());
}

TEST_CASE("Upload: one job at a time", "[upload]") {
  Rig rig;
  const auto data = Payload(2000U);
  UploadOptions o = FastOptions();
  o.chunk_delay_ms = 10U;
  auto first = rig.uploads.StartUpload(2U, data.data(), 2000U, o);
  REQUIRE(first.has_value());
  auto second = rig.uploads.StartUpload(3U, data.data(), 2000U, o);
  REQUIRE_FALSE(second.has_value());
  REQUIRE(second.get_error() == UploadError::kBusy);

  auto slot_op = rig.uploads.Delete(3U);
  REQUIRE_FALSE(slot_op.has_value());
  REQUIRE(slot_op.get_error() == UploadError::kBusy);
  REQUIRE(rig.uploads.CancelUpload(first.value()).has_value());
}

// ============================================================================
// Jobs, callbacks, slots
// ============================================================================

TEST_CASE("Upload: job history and unknown ids", "[upload]") {
  Rig rig;
  REQUIRE_FALSE(rig.uploads.GetJob(42U).has_value());
  auto cancel = rig.uploads.CancelUpload(42U);
  REQUIRE_FALSE(cancel.has_value());
  REQUIRE(cancel.get_error() == UploadError::kNotFound);

  const auto data = Payload(20U);
  auto a = rig.uploads.StartUpload(1U, data.data(), 20U, FastOptions());
  REQUIRE(a.has_value());
  (void)RunToEnd(rig.uploads, a.value());
  auto b = rig.uploads.StartUpload(2U, data.data(), 20U, FastOptions());
  REQUIRE(b.has_value());
  (void)RunToEnd(rig.uploads, b.value());

  REQUIRE(a.value() != b.value());
  auto old = rig.uploads.GetJob(a.value());
  REQUIRE(old.has_value());
  REQUIRE(old.value().slot == 1U);
  REQUIRE(old.value().state == JobState::kDownloaded);
  REQUIRE(rig.uploads.CancelUpload(a.value()).has_value());
}

namespace {

struct CallbackRecorder {
  std::atomic<uint32_t> progress_calls{0};
  std::atomic<uint32_t> last_bytes{0};
  std::atomic<bool> monotonic{true};
  std::atomic<uint32_t> complete_calls{0};
  std::atomic<uint8_t> final_state{0};

  static void OnProgress(const fluff::UploadProgress& p, void* ctx) {
    auto* self = static_cast<CallbackRecorder*>(ctx);
    if (p.bytes_sent <= self->last_bytes.load()) self->monotonic = false;
    self->last_bytes = p.bytes_sent;
    self->progress_calls.fetch_add(1U);
  }

  static void OnComplete(const fluff::UploadJob& job, void* ctx) {
    auto* self = static_cast<CallbackRecorder*>(ctx);
    self->final_state = static_cast<uint8_t>(job.state);
    self->complete_calls.fetch_add(1U);
  }
};

}  // namespace

TEST_CASE("Upload: progress and completion callbacks", "[upload]") {
  Rig rig;
  CallbackRecorder recorder;
  const auto data = Payload(47U);
  UploadOptions o = FastOptions();
  o.on_progress = &CallbackRecorder::OnProgress;
  o.progress_ctx = &recorder;
  o.on_complete = &CallbackRecorder::OnComplete;
  o.complete_ctx = &recorder;
  auto id = rig.uploads.StartUpload(2U, data.data(), 47U, o);
  REQUIRE(id.has_value());
  (void)RunToEnd(rig.uploads, id.value());

  REQUIRE(WaitUntil([&]() { return recorder.complete_calls.load() == 1U; }));
  REQUIRE(recorder.progress_calls.load() == 3U);
  REQUIRE(recorder.last_bytes.load() == 47U);
  REQUIRE(recorder.monotonic.load());
  REQUIRE(recorder.final_state.load() ==
          static_cast<uint8_t>(JobState::kDownloaded));
}

TEST_CASE("Upload: slot operations", "[upload][slot]") {
  Rig rig;
  REQUIRE(rig.uploads.LoadAndActivate(5U).has_value());
  REQUIRE(rig.uploads.PredictedSlotState(5U) == SlotState::kActive);
  REQUIRE(rig.uploads.Deactivate(5U).has_value());
  REQUIRE(rig.uploads.PredictedSlotState(5U) == SlotState::kEmpty);
  REQUIRE(rig.uploads.Delete(6U).has_value());

  auto gp = rig.transport.WritesTo(Endpoint::kGeneralPlusWrite);
  REQUIRE(gp.size() == 4U);
  REQUIRE(gp[0].bytes == std::vector<uint8_t>{0x60, 0x05});
  REQUIRE(gp[1].bytes == std::vector<uint8_t>{0x61});
  REQUIRE(gp[2].bytes == std::vector<uint8_t>{0x62, 0x05});
  REQUIRE(gp[3].bytes == std::vector<uint8_t>{0x74, 0x06});
}

TEST_CASE("Upload: slot report overrides the prediction", "[upload][slot]") {
  Rig rig;
  REQUIRE(rig.uploads.LoadAndActivate(7U).has_value());
  REQUIRE(rig.uploads.QuerySlot(7U).has_value());
  REQUIRE(rig.transport.WritesTo(Endpoint::kGeneralPlusWrite).back().bytes ==
          std::vector<uint8_t>{0x73, 0x07});
  REQUIRE_FALSE(rig.uploads.ObservedSlotState(7U).has_value());

  REQUIRE(rig.transport.Inject(Endpoint::kGeneralPlusListen, {0x73, 0x07, 0x02}));
  REQUIRE(WaitUntil([&]() {
    return rig.uploads.ObservedSlotState(7U).has_value();
  }));
  REQUIRE(rig.uploads.ObservedSlotState(7U).value() == SlotState::kDownloaded);
  REQUIRE(rig.uploads.PredictedSlotState(7U) == SlotState::kDownloaded);
}

TEST_CASE("Upload: slot operations need a link", "[upload][slot]") {
  MockTransport t;
  Session s(t);
  Uploader up(s);
  auto r = up.Delete(1U);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == UploadError::kNotConnected);
}
