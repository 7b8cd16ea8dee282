/**
 * @file loopback_demo.cpp
 * @brief End-to-end controller demo against a simulated device.
 *
 * Demonstrates:
 * - Discovery by name filter and connection with retries
 * - Behavior, color, mood and name commands
 * - Device Information strings
 * - Notification subscriptions and session state listeners
 * - A chunked upload with progress reporting, then load + activate
 * - Optional INI settings file (first argument)
 *
 * The LoopbackRadio below stands in for a BLE stack: notifications are
 * delivered from its own thread, as a real radio would.
 */

#include "fluff/controller.hpp"
#include "fluff/log.hpp"
#include "fluff/settings.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

// ============================================================================
// Simulated radio + device
// ============================================================================

class LoopbackRadio {
 public:
  LoopbackRadio() : radio_thread_([this]() { RadioMain(); }) {}

  ~LoopbackRadio() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      stop_ = true;
    }
    cv_.notify_all();
    radio_thread_.join();
  }

  LoopbackRadio(const LoopbackRadio&) = delete;
  LoopbackRadio& operator=(const LoopbackRadio&) = delete;

  fluff::TransportResult Connect(const char* address, uint32_t timeout_ms) {
    (void)timeout_ms;
    if (std::strcmp(address, kAddress) != 0) {
      return fluff::TransportResult::error(fluff::TransportError::kTimeout);
    }
    connected_.store(true);
    // The device reports its firmware shortly after the link comes up.
    Queue(fluff::Endpoint::kNordicListen,
          {fluff::tag::kFirmwareVersion, 0x02, 0x01, 0x00, 0x07});
    return fluff::TransportResult::success();
  }

  void Disconnect() { connected_.store(false); }

  fluff::TransportResult Write(fluff::Endpoint ep, const uint8_t* data,
                               uint32_t len) {
    if (!connected_.load()) {
      return fluff::TransportResult::error(
          fluff::TransportError::kNotConnected);
    }
    Device(ep, data, len);
    return fluff::TransportResult::success();
  }

  fluff::expected<uint32_t, fluff::TransportError> Read(fluff::Endpoint ep,
                                                         uint8_t* buf,
                                                         uint32_t cap) {
    using Result = fluff::expected<uint32_t, fluff::TransportError>;
    if (!connected_.load()) {
      return Result::error(fluff::TransportError::kNotConnected);
    }
    const char* value = nullptr;
    switch (ep) {
      case fluff::Endpoint::kManufacturerName: value = "Hasbro"; break;
      case fluff::Endpoint::kModelNumber:      value = "Furby Connect"; break;
      case fluff::Endpoint::kFirmwareRevision: value = "2.1.0.7"; break;
      default: return Result::error(fluff::TransportError::kReadFailed);
    }
    uint32_t n = static_cast<uint32_t>(std::strlen(value));
    if (n > cap) n = cap;
    std::memcpy(buf, value, n);
    return Result::success(n);
  }

  fluff::TransportResult Subscribe(fluff::Endpoint ep, fluff::NotifyFn fn,
                                   void* ctx) {
    std::lock_guard<std::mutex> lock(mtx_);
    sinks_[static_cast<uint32_t>(ep)] = Sink{fn, ctx};
    return fluff::TransportResult::success();
  }

  void Unsubscribe(fluff::Endpoint ep) {
    std::lock_guard<std::mutex> lock(mtx_);
    sinks_[static_cast<uint32_t>(ep)] = Sink{};
  }

  fluff::TransportResult StartScan() {
    scan_index_ = 0;
    return fluff::TransportResult::success();
  }

  bool NextAdvertisement(fluff::Advertisement& out, uint32_t wait_ms) {
    static const char* const kNames[] = {"Speaker", "Furby"};
    static const char* const kAddrs[] = {"00:11:22:33:44:55", kAddress};
    if (scan_index_ >= 2U) {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
      return false;
    }
    out.address.assign(fluff::TruncateToCapacity, kAddrs[scan_index_]);
    out.name.assign(fluff::TruncateToCapacity, kNames[scan_index_]);
    out.rssi = static_cast<int16_t>(-70 + 10 * static_cast<int>(scan_index_));
    ++scan_index_;
    return true;
  }

  void StopScan() {}

  static constexpr const char* kAddress = "C0:FF:EE:00:BE:EF";

 private:
  struct Sink {
    fluff::NotifyFn fn = nullptr;
    void* ctx = nullptr;
  };

  struct Pending {
    fluff::Endpoint ep;
    std::vector<uint8_t> bytes;
  };

  // Minimal device model: generic ack for behavior commands, ready and
  // completion status around uploads, one transfer ack per chunk.
  void Device(fluff::Endpoint ep, const uint8_t* data, uint32_t len) {
    if (len == 0U) return;
    if (ep == fluff::Endpoint::kGeneralPlusWrite) {
      if (data[0] == fluff::tag::kAnnounceUpload && len >= 6U) {
        expected_ = (static_cast<uint32_t>(data[2]) << 16U) |
                    (static_cast<uint32_t>(data[3]) << 8U) | data[4];
        received_ = 0;
        Queue(fluff::Endpoint::kGeneralPlusListen,
              {fluff::tag::kTransferStatus, 2});
      } else if (data[0] == fluff::tag::kTriggerBehavior) {
        Queue(fluff::Endpoint::kGeneralPlusListen,
              {fluff::tag::kGenericAck, data[2]});
      }
      return;
    }
    if (ep != fluff::Endpoint::kFileWrite) return;
    received_ += len;
    Queue(fluff::Endpoint::kNordicListen, {fluff::tag::kTransferAck, 1});
    if (received_ >= expected_) {
      Queue(fluff::Endpoint::kGeneralPlusListen,
            {fluff::tag::kTransferStatus, 5});
    }
  }

  void Queue(fluff::Endpoint ep, std::vector<uint8_t> bytes) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      pending_.push_back(Pending{ep, std::move(bytes)});
    }
    cv_.notify_one();
  }

  void RadioMain() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
      cv_.wait(lock, [this]() { return stop_ || !pending_.empty(); });
      if (stop_) return;
      Pending p = std::move(pending_.front());
      pending_.pop_front();
      const Sink sink = sinks_[static_cast<uint32_t>(p.ep)];
      if (sink.fn != nullptr) {
        sink.fn(p.bytes.data(), static_cast<uint32_t>(p.bytes.size()),
                sink.ctx);
      }
    }
  }

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Pending> pending_;
  Sink sinks_[fluff::kEndpointCount];
  bool stop_ = false;
  std::atomic<bool> connected_{false};
  uint32_t scan_index_ = 0;
  uint32_t expected_ = 0;
  uint32_t received_ = 0;
  std::thread radio_thread_;
};

// ============================================================================
// Callbacks
// ============================================================================

static void OnState(fluff::SessionState from, fluff::SessionState to,
                    void* /*ctx*/) {
  std::printf("  session: %s -> %s\n", fluff::SessionStateName(from),
              fluff::SessionStateName(to));
}

static void OnEvent(const fluff::NotificationEvent& ev, void* /*ctx*/) {
  std::printf("  event  : %-16s tag=0x%02X value=%u\n",
              fluff::EventTypeName(ev.type), ev.tag,
              static_cast<unsigned>(ev.value));
}

static void OnProgress(const fluff::UploadProgress& p, void* /*ctx*/) {
  if (p.chunks_sent % 10U == 0U || p.bytes_sent == p.total_bytes) {
    std::printf("  upload : %u/%u bytes, %u chunks acked\n", p.bytes_sent,
                p.total_bytes, p.chunks_acked);
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  fluff::log::Init();

  fluff::Settings settings;
  settings.session.keepalive_interval_ms = 1000U;
  settings.upload.chunk_delay_ms = 1U;
  settings.upload.activate = true;
#ifdef FLUFF_CONFIG_INI_ENABLED
  if (argc > 1) {
    fluff::IniConfig cfg;
    auto loaded = cfg.LoadFile(argv[1]);
    if (!loaded.has_value()) return 1;
    if (!fluff::LoadSettings(cfg, settings).has_value()) return 1;
  }
#else
  (void)argc;
  (void)argv;
#endif
  fluff::ApplySettings(settings);

  LoopbackRadio radio;
  fluff::Controller<LoopbackRadio> furby(radio, settings.session);
  (void)furby.AddStateListener(&OnState, nullptr);

  std::printf("[1] connect\n");
  auto connected =
      settings.address.empty()
          ? furby.Connect(settings.connect)
          : furby.ConnectAddress(settings.address.c_str(), settings.connect);
  if (!connected.has_value()) {
    std::printf("connect failed: %s\n",
                fluff::SessionErrorName(connected.get_error()));
    return 1;
  }
  std::printf("  device : %s (%s)\n", connected.value().address.c_str(),
              connected.value().name.c_str());
  auto sub = furby.SubscribeAll(&OnEvent, nullptr);
  if (!sub.has_value()) return 1;

  std::printf("[2] commands\n");
  (void)furby.SetIndicatorColor(0, 128, 255);
  (void)furby.TriggerBehavior(55, 2, 14, 0);
  (void)furby.SetMood(fluff::MoodType::kExcitedness, 90);
  (void)furby.SetName(12);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  char fw[24];
  furby.Identity().FormatFirmware(fw, sizeof(fw));
  std::printf("  firmware %s\n", fw);
  auto info = furby.ReadDeviceInfo();
  if (info.has_value()) {
    std::printf("  info   : %s / %s / rev %s (%u fields)\n",
                info.value().manufacturer.c_str(),
                info.value().model_number.c_str(),
                info.value().firmware_revision.c_str(),
                info.value().fields_read);
  }

  std::printf("[3] upload\n");
  std::vector<uint8_t> dlc(1000U);
  for (size_t i = 0; i < dlc.size(); ++i) dlc[i] = static_cast<uint8_t>(i);
  fluff::UploadOptions opts = settings.upload;
  opts.on_progress = &OnProgress;
  auto job_id = furby.StartUpload(settings.upload_slot, dlc.data(),
                                  static_cast<uint32_t>(dlc.size()), opts);
  if (!job_id.has_value()) {
    std::printf("upload rejected: %s\n",
                fluff::UploadErrorName(job_id.get_error()));
    return 1;
  }
  auto job = furby.WaitForJob(job_id.value(), 30000U);
  if (!job.has_value()) {
    std::printf("upload did not finish\n");
    (void)furby.CancelUpload(job_id.value());
    return 1;
  }
  std::printf("  job %u: %s%s%s\n", job.value().id,
              fluff::JobStateName(job.value().state),
              job.value().has_error ? " / " : "",
              job.value().has_error ? fluff::UploadErrorName(job.value().error)
                                    : "");

  std::printf("[4] disconnect\n");
  (void)furby.Unsubscribe(sub.value());
  (void)furby.Disconnect();
  (void)furby.RemoveStateListener(&OnState, nullptr);

  fluff::log::Shutdown();
  return job.value().has_error ? 1 : 0;
}
