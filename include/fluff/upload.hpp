/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file upload.hpp
 * @brief Chunked content upload into device storage slots.
 *
 * Transfer sequence (writer thread):
 *
 *   control  : 09 01 00                     enable transfer acks
 *   behavior : 50 00 S2 S1 S0 slot name..   announce
 *   behavior <- 24 02 | 24 04               ready / append (optional wait)
 *   bulk     : chunk[0] .. chunk[n-1]       20 bytes each, last shorter
 *   control <-  09 k                        k more chunks received
 *   control <-  0a                          overload, back off
 *   behavior <- 24 05 | 73 slot 02          downloaded
 *   behavior : 60 slot, 61                  load, activate (optional)
 *
 * Job states (forward only):
 *
 *   Pending -> Announced -> Transferring -> Downloaded -> Loaded -> Active
 *                 |              |              |           |
 *                 +--------------+----> Stalled / Aborted <-+
 *
 * One writer thread owns the job. Notification and session listeners only
 * record into atomics and wake the writer. The device's slot reports are
 * authoritative; the slot table holds predictions reconciled against them.
 * No checksum exists in the protocol, so integrity beyond the byte count
 * cannot be verified. Nothing is rolled back: delete the slot before
 * retrying a failed upload.
 */

#ifndef FLUFF_UPLOAD_HPP_
#define FLUFF_UPLOAD_HPP_

#include "fluff/channel_registry.hpp"
#include "fluff/log.hpp"
#include "fluff/protocol.hpp"
#include "fluff/session.hpp"
#include "fluff/state_machine.hpp"
#include "fluff/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#ifndef FLUFF_UPLOAD_JOB_HISTORY
#define FLUFF_UPLOAD_JOB_HISTORY 8U
#endif

namespace fluff {

// ============================================================================
// Types
// ============================================================================

enum class JobState : uint8_t {
  kPending = 0,
  kAnnounced,
  kTransferring,
  kDownloaded,
  kLoaded,
  kActive,
  kStalled,
  kAborted,
};

static constexpr uint32_t kJobStateCount = 8U;

inline const char* JobStateName(JobState s) noexcept {
  switch (s) {
    case JobState::kPending:      return "Pending";
    case JobState::kAnnounced:    return "Announced";
    case JobState::kTransferring: return "Transferring";
    case JobState::kDownloaded:   return "Downloaded";
    case JobState::kLoaded:       return "Loaded";
    case JobState::kActive:       return "Active";
    case JobState::kStalled:      return "Stalled";
    case JobState::kAborted:      return "Aborted";
    default:                      return "?";
  }
}

enum class UploadError : uint8_t {
  kNotConnected,
  kBusy,
  kInvalidArgument,
  kWriteFailed,
  kStalled,            ///< acks stopped arriving
  kLinkLost,
  kCancelled,
  kSlotOccupied,       ///< device reported the file already exists
  kDeviceNotReady,     ///< no ready/append status after the announce
  kDeviceRejected,     ///< device reported a receive error
  kDeviceTimeout,      ///< device reported its own transfer timeout
  kCompletionTimeout,  ///< no download confirmation after the last chunk
  kNotFound,
};

inline const char* UploadErrorName(UploadError e) noexcept {
  switch (e) {
    case UploadError::kNotConnected:      return "NotConnected";
    case UploadError::kBusy:              return "Busy";
    case UploadError::kInvalidArgument:   return "InvalidArgument";
    case UploadError::kWriteFailed:       return "WriteFailed";
    case UploadError::kStalled:           return "Stalled";
    case UploadError::kLinkLost:          return "LinkLost";
    case UploadError::kCancelled:         return "Cancelled";
    case UploadError::kSlotOccupied:      return "SlotOccupied";
    case UploadError::kDeviceNotReady:    return "DeviceNotReady";
    case UploadError::kDeviceRejected:    return "DeviceRejected";
    case UploadError::kDeviceTimeout:     return "DeviceTimeout";
    case UploadError::kCompletionTimeout: return "CompletionTimeout";
    case UploadError::kNotFound:          return "NotFound";
    default:                              return "Unknown";
  }
}

using JobId = uint32_t;
static constexpr JobId kInvalidJob = 0U;

using UploadName = FixedString<kUploadNameSize>;

/// Snapshot of one upload job.
struct UploadJob {
  JobId id = kInvalidJob;
  uint8_t slot = 0;
  UploadName name;
  uint32_t total_bytes = 0;
  uint32_t chunk_size = kChunkSize;
  uint32_t chunks_total = 0;
  uint32_t bytes_sent = 0;
  uint32_t chunks_sent = 0;
  uint32_t chunks_acked = 0;
  uint32_t overloads = 0;
  uint64_t started_us = 0;
  uint64_t last_ack_us = 0;
  uint64_t finished_us = 0;
  SlotState predicted_slot_state = SlotState::kEmpty;
  bool slot_observed = false;
  SlotState observed_slot_state = SlotState::kEmpty;
  JobState state = JobState::kPending;
  bool finished = false;
  bool has_error = false;
  UploadError error = UploadError::kCancelled;
};

struct UploadProgress {
  JobId id;
  JobState state;
  uint32_t bytes_sent;
  uint32_t total_bytes;
  uint32_t chunks_sent;
  uint32_t chunks_total;
  uint32_t chunks_acked;
};

using UploadProgressFn = void (*)(const UploadProgress& progress, void* ctx);
using UploadCompleteFn = void (*)(const UploadJob& job, void* ctx);

struct UploadOptions {
  UploadName filename{"UPLOAD.DLC"};
  bool enable_ack = true;
  bool activate = false;                  ///< LoadSlot + ActivateSlot after
  uint32_t ready_timeout_ms = 10000U;     ///< 0 skips the ready wait
  uint32_t chunk_delay_ms = 5U;
  uint32_t stall_timeout_ms = 5000U;      ///< 0 disables stall detection
  uint32_t max_unacked_chunks = 0U;       ///< 0 = unlimited in-flight
  uint32_t overload_delay_ms = 200U;
  uint32_t completion_timeout_ms = 60000U;
  UploadProgressFn on_progress = nullptr;
  void* progress_ctx = nullptr;
  UploadCompleteFn on_complete = nullptr;
  void* complete_ctx = nullptr;
};

/// Number of bulk chunks needed for @p size bytes.
inline uint32_t ChunkCount(uint32_t size) noexcept {
  return (size + kChunkSize - 1U) / kChunkSize;
}

/// Length of chunk @p index for a @p size-byte upload.
inline uint32_t ChunkLength(uint32_t size, uint32_t index) noexcept {
  const uint32_t offset = index * kChunkSize;
  if (offset >= size) return 0U;
  return std::min(kChunkSize, size - offset);
}

// ============================================================================
// Job state machine
// ============================================================================

namespace detail {

enum JobEvent : uint32_t {
  kEvAnnounced = 1,
  kEvTransfer,
  kEvDownloaded,
  kEvLoaded,
  kEvActivated,
  kEvStall,
  kEvAbort,
};

struct JobFsmContext {
  StateMachine<JobFsmContext, JobState, kJobStateCount>* sm = nullptr;
  UploadJob* job = nullptr;
};

inline TransitionResult JobFailure(JobFsmContext& ctx, const Event& ev) {
  if (ev.id == kEvStall) return ctx.sm->RequestTransition(JobState::kStalled);
  if (ev.id == kEvAbort) return ctx.sm->RequestTransition(JobState::kAborted);
  return TransitionResult::kUnhandled;
}

inline TransitionResult JobPendingHandler(JobFsmContext& ctx, const Event& ev) {
  if (ev.id == kEvAnnounced) {
    return ctx.sm->RequestTransition(JobState::kAnnounced);
  }
  return JobFailure(ctx, ev);
}

inline TransitionResult JobAnnouncedHandler(JobFsmContext& ctx,
                                            const Event& ev) {
  if (ev.id == kEvTransfer) {
    return ctx.sm->RequestTransition(JobState::kTransferring);
  }
  return JobFailure(ctx, ev);
}

inline TransitionResult JobTransferringHandler(JobFsmContext& ctx,
                                               const Event& ev) {
  if (ev.id == kEvDownloaded) {
    return ctx.sm->RequestTransition(JobState::kDownloaded);
  }
  return JobFailure(ctx, ev);
}

inline TransitionResult JobDownloadedHandler(JobFsmContext& ctx,
                                             const Event& ev) {
  if (ev.id == kEvLoaded) return ctx.sm->RequestTransition(JobState::kLoaded);
  if (ev.id == kEvAbort) return ctx.sm->RequestTransition(JobState::kAborted);
  return TransitionResult::kUnhandled;
}

inline TransitionResult JobLoadedHandler(JobFsmContext& ctx, const Event& ev) {
  if (ev.id == kEvActivated) {
    return ctx.sm->RequestTransition(JobState::kActive);
  }
  if (ev.id == kEvAbort) return ctx.sm->RequestTransition(JobState::kAborted);
  return TransitionResult::kUnhandled;
}

inline void JobEnterAnnounced(JobFsmContext& ctx) {
  ctx.job->predicted_slot_state = SlotState::kInProgress;
}

inline void JobEnterDownloaded(JobFsmContext& ctx) {
  ctx.job->predicted_slot_state = SlotState::kDownloaded;
}

inline void JobEnterActive(JobFsmContext& ctx) {
  ctx.job->predicted_slot_state = SlotState::kActive;
}

}  // namespace detail

// ============================================================================
// UploadController
// ============================================================================

/**
 * @brief Runs at most one upload at a time over a session's bulk channel.
 *
 * @tparam Transport  Radio transport of the owning session.
 */
template <typename Transport>
class UploadController final {
 public:
  using Session = SessionManager<Transport>;

  explicit UploadController(Session& session)
      : session_(session), fsm_(fsm_ctx_) {
    fsm_ctx_.sm = &fsm_;
    fsm_ctx_.job = &work_;
    fsm_.AddState(JobState::kPending,
                  {"Pending", detail::JobPendingHandler, nullptr, nullptr});
    fsm_.AddState(JobState::kAnnounced,
                  {"Announced", detail::JobAnnouncedHandler,
                   detail::JobEnterAnnounced, nullptr});
    fsm_.AddState(JobState::kTransferring,
                  {"Transferring", detail::JobTransferringHandler, nullptr,
                   nullptr});
    fsm_.AddState(JobState::kDownloaded,
                  {"Downloaded", detail::JobDownloadedHandler,
                   detail::JobEnterDownloaded, nullptr});
    fsm_.AddState(JobState::kLoaded,
                  {"Loaded", detail::JobLoadedHandler, nullptr, nullptr});
    fsm_.AddState(JobState::kActive,
                  {"Active", nullptr, detail::JobEnterActive, nullptr});
    fsm_.AddState(JobState::kStalled, {"Stalled", nullptr, nullptr, nullptr});
    fsm_.AddState(JobState::kAborted, {"Aborted", nullptr, nullptr, nullptr});

    auto sub = session_.Channels().SubscribeAll(&UploadController::OnEvent,
                                                this);
    if (sub.has_value()) {
      event_sub_ = sub.value();
    } else {
      FLUFF_LOG_ERROR("Upload", "notification listener not registered: %s",
                      RegistryErrorName(sub.get_error()));
    }
    auto listener = session_.AddStateListener(
        &UploadController::OnSessionState, this);
    if (!listener.has_value()) {
      FLUFF_LOG_ERROR("Upload", "session listener not registered: %s",
                      SessionErrorName(listener.get_error()));
    }
  }

  ~UploadController() {
    cancel_.store(true, std::memory_order_release);
    Wake();
    if (writer_.joinable()) writer_.join();
    (void)session_.RemoveStateListener(&UploadController::OnSessionState,
                                       this);
    if (event_sub_ != kInvalidSubscription) {
      (void)session_.Channels().Unsubscribe(event_sub_);
    }
  }

  UploadController(const UploadController&) = delete;
  UploadController& operator=(const UploadController&) = delete;

  // --------------------------------------------------------------------------
  // Jobs
  // --------------------------------------------------------------------------

  /**
   * @brief Start uploading @p size bytes into @p slot.
   *
   * @p data must stay valid until the job finishes. Returns immediately;
   * the transfer runs on the writer thread.
   */
  expected<JobId, UploadError> StartUpload(
      uint8_t slot, const uint8_t* data, uint32_t size,
      const UploadOptions& options = UploadOptions{}) {
    using Result = expected<JobId, UploadError>;
    std::unique_lock<std::mutex> control(control_mtx_, std::try_to_lock);
    if (!control.owns_lock() || running_.load(std::memory_order_acquire)) {
      return Result::error(UploadError::kBusy);
    }
    if (!session_.IsConnected()) {
      return Result::error(UploadError::kNotConnected);
    }
    if (data == nullptr || size == 0U || size > kMaxUploadSize) {
      return Result::error(UploadError::kInvalidArgument);
    }
    auto announce = MakeAnnounceUpload(slot, size, options.filename.c_str());
    if (!announce.has_value()) {
      FLUFF_LOG_WARN("Upload", "rejected: %s",
                     CommandErrorName(announce.get_error()));
      return Result::error(UploadError::kInvalidArgument);
    }
    if (writer_.joinable()) {
      if (writer_.get_id() == std::this_thread::get_id()) {
        return Result::error(UploadError::kBusy);
      }
      writer_.join();
    }

    ResetSignals(slot);
    data_ = data;
    options_ = options;
    fsm_.Reset();

    UploadJob job;
    {
      std::lock_guard<std::mutex> lock(job_mtx_);
      job.id = next_id_++;
      if (next_id_ == kInvalidJob) next_id_ = 1U;
      job.slot = slot;
      job.name = options.filename;
      job.total_bytes = size;
      job.chunks_total = ChunkCount(size);
      job.started_us = SteadyNowUs();
      job.predicted_slot_state = PredictedSlotState(slot);
      job_ = job;
    }
    work_ = job;
    fsm_.Start(JobState::kPending);

    running_.store(true, std::memory_order_release);
    writer_ = std::thread([this]() { WriterMain(); });
    FLUFF_LOG_INFO("Upload", "job %u: %u bytes (%u chunks) -> slot %u '%s'",
                   job.id, size, job.chunks_total, static_cast<unsigned>(slot),
                   job.name.c_str());
    return Result::success(job.id);
  }

  /// Stops chunk emission promptly. The session stays connected.
  expected<void, UploadError> CancelUpload(JobId id) {
    {
      std::lock_guard<std::mutex> lock(job_mtx_);
      if (job_.id != id || id == kInvalidJob) {
        return FindInHistory(id) != nullptr
                   ? expected<void, UploadError>::success()
                   : expected<void, UploadError>::error(UploadError::kNotFound);
      }
      if (job_.finished) return expected<void, UploadError>::success();
    }
    FLUFF_LOG_INFO("Upload", "job %u: cancel requested", id);
    cancel_.store(true, std::memory_order_release);
    Wake();
    std::lock_guard<std::mutex> control(control_mtx_);
    if (writer_.joinable() &&
        writer_.get_id() != std::this_thread::get_id()) {
      writer_.join();
    }
    return expected<void, UploadError>::success();
  }

  optional<UploadJob> GetJob(JobId id) const {
    std::lock_guard<std::mutex> lock(job_mtx_);
    if (id != kInvalidJob && job_.id == id) return optional<UploadJob>(job_);
    const UploadJob* past = FindInHistory(id);
    return past != nullptr ? optional<UploadJob>(*past) : optional<UploadJob>();
  }

  /// Blocks until job @p id has finished or @p timeout_ms elapsed.
  optional<UploadJob> WaitForJob(JobId id, uint32_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(job_mtx_);
    const bool done = done_cv_.wait_for(
        lock, std::chrono::milliseconds(timeout_ms), [this, id]() {
          return (job_.id == id && job_.finished) ||
                 (job_.id != id && FindInHistory(id) != nullptr);
        });
    if (!done) return optional<UploadJob>();
    if (job_.id == id) return optional<UploadJob>(job_);
    return optional<UploadJob>(*FindInHistory(id));
  }

  bool IsBusy() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  // --------------------------------------------------------------------------
  // Slot operations
  // --------------------------------------------------------------------------

  expected<void, UploadError> LoadAndActivate(uint8_t slot) {
    auto r = IssueSlotCommand(MakeLoadSlot(slot));
    if (!r.has_value()) return r;
    r = IssueSlotCommand(MakeActivateSlot());
    if (r.has_value()) SetPredicted(slot, SlotState::kActive);
    return r;
  }

  expected<void, UploadError> Deactivate(uint8_t slot) {
    auto r = IssueSlotCommand(MakeDeactivateSlot(slot));
    if (r.has_value()) SetPredicted(slot, SlotState::kEmpty);
    return r;
  }

  expected<void, UploadError> Delete(uint8_t slot) {
    auto r = IssueSlotCommand(MakeDeleteSlot(slot));
    if (r.has_value()) SetPredicted(slot, SlotState::kEmpty);
    return r;
  }

  /// Ask the device for the slot's state. The reply updates the slot table.
  expected<void, UploadError> QuerySlot(uint8_t slot) {
    return IssueSlotCommand(MakeQuerySlotInfo(slot));
  }

  SlotState PredictedSlotState(uint8_t slot) const {
    std::lock_guard<std::mutex> lock(slots_mtx_);
    return slots_[slot].predicted;
  }

  optional<SlotState> ObservedSlotState(uint8_t slot) const {
    std::lock_guard<std::mutex> lock(slots_mtx_);
    return slots_[slot].observed_known ? optional<SlotState>(slots_[slot].observed)
                                       : optional<SlotState>();
  }

 private:
  struct SlotRecord {
    SlotState predicted = SlotState::kEmpty;
    bool observed_known = false;
    SlotState observed = SlotState::kEmpty;
  };

  enum class WaitOutcome : uint8_t {
    kSatisfied,
    kTimeout,
    kCancelled,
    kLinkLost,
    kStalled,
  };

  static constexpr uint32_t kWaitSliceMs = 10U;
  static constexpr uint8_t kNoStatus = 0U;

  // --------------------------------------------------------------------------
  // Writer thread
  // --------------------------------------------------------------------------

  void WriterMain() {
    const UploadError err = RunTransfer();
    const JobState state = fsm_.Current();
    const bool failed = (state == JobState::kStalled ||
                         state == JobState::kAborted);
    if (failed) {
      FLUFF_LOG_ERROR("Upload", "job %u %s: %s", work_.id, JobStateName(state),
                      UploadErrorName(err));
    } else {
      FLUFF_LOG_INFO("Upload", "job %u %s (%u/%u chunks acked)", work_.id,
                     JobStateName(state), acked_.load(), work_.chunks_sent);
    }

    UploadJob final_job;
    {
      std::lock_guard<std::mutex> lock(job_mtx_);
      work_.finished = true;
      work_.finished_us = SteadyNowUs();
      work_.has_error = failed;
      if (failed) work_.error = err;
      PublishLocked();
      final_job = job_;
      history_[history_next_] = job_;
      history_next_ = (history_next_ + 1U) % FLUFF_UPLOAD_JOB_HISTORY;
      if (history_count_ < FLUFF_UPLOAD_JOB_HISTORY) ++history_count_;
    }
    running_.store(false, std::memory_order_release);
    done_cv_.notify_all();
    if (options_.on_complete != nullptr) {
      options_.on_complete(final_job, options_.complete_ctx);
    }
  }

  // Returns the error that ended the job; meaningless on success.
  UploadError RunTransfer() {
    // 1. transfer acks
    if (options_.enable_ack) {
      if (!IssueOrAbort(Command(EnableTransferAck{true}))) {
        return UploadError::kWriteFailed;
      }
    }

    // 2. announce, optionally wait for ready
    auto announce = MakeAnnounceUpload(work_.slot, work_.total_bytes,
                                       work_.name.c_str());
    if (!IssueOrAbort(announce.value())) return UploadError::kWriteFailed;
    Transition(detail::kEvAnnounced);

    if (options_.ready_timeout_ms > 0U) {
      const WaitOutcome w = WaitUntil(
          [this]() {
            const uint8_t s = last_status_.load(std::memory_order_acquire);
            return s == static_cast<uint8_t>(TransferStatus::kExists) ||
                   s == static_cast<uint8_t>(TransferStatus::kReady) ||
                   s == static_cast<uint8_t>(TransferStatus::kAppend);
          },
          options_.ready_timeout_ms, false);
      if (w == WaitOutcome::kTimeout) {
        return Fail(UploadError::kDeviceNotReady);
      }
      if (w != WaitOutcome::kSatisfied) return Fail(OutcomeError(w));
      if (last_status_.load(std::memory_order_acquire) ==
          static_cast<uint8_t>(TransferStatus::kExists)) {
        return Fail(UploadError::kSlotOccupied);
      }
    }

    // 3. chunks
    Transition(detail::kEvTransfer);
    for (uint32_t i = 0; i < work_.chunks_total; ++i) {
      UploadError reason = UploadError::kCancelled;
      if (CheckInterrupted(reason) || CheckDeviceVerdict(reason)) {
        return Fail(reason);
      }

      if (overload_pending_.exchange(false, std::memory_order_acq_rel)) {
        ++work_.overloads;
        FLUFF_LOG_WARN("Upload", "job %u: device overloaded, pausing %u ms",
                       work_.id, options_.overload_delay_ms);
        const WaitOutcome w = Pause(options_.overload_delay_ms);
        if (w != WaitOutcome::kTimeout) return Fail(OutcomeError(w));
      }

      if (options_.enable_ack && options_.max_unacked_chunks > 0U) {
        const WaitOutcome w = WaitUntil(
            [this]() {
              return Unacked() < options_.max_unacked_chunks;
            },
            0U, true);
        if (w != WaitOutcome::kSatisfied) return Fail(OutcomeError(w));
      }

      if (IsStalled(SteadyNowUs())) return Fail(UploadError::kStalled);

      const uint32_t offset = i * kChunkSize;
      const uint32_t len = ChunkLength(work_.total_bytes, i);
      if (Unacked() == 0U) unacked_since_us_ = SteadyNowUs();
      auto w = session_.Channels().Publish(Channel::kBulk, data_ + offset, len);
      if (!w.has_value()) {
        return Fail(w.get_error() == RegistryError::kNotConnected
                        ? UploadError::kLinkLost
                        : UploadError::kWriteFailed);
      }
      work_.bytes_sent += len;
      ++work_.chunks_sent;
      chunks_sent_.store(work_.chunks_sent, std::memory_order_release);
      Publish();
      ReportProgress();

      if (options_.chunk_delay_ms > 0U && i + 1U < work_.chunks_total) {
        const WaitOutcome p = Pause(options_.chunk_delay_ms);
        if (p != WaitOutcome::kTimeout) return Fail(OutcomeError(p));
      }
    }

    // 4. wait for the device to confirm the download
    const WaitOutcome w = WaitUntil(
        [this]() {
          const uint8_t s = last_status_.load(std::memory_order_acquire);
          return slot_downloaded_.load(std::memory_order_acquire) ||
                 s == static_cast<uint8_t>(TransferStatus::kComplete) ||
                 s == static_cast<uint8_t>(TransferStatus::kError) ||
                 s == static_cast<uint8_t>(TransferStatus::kTimeout);
        },
        options_.completion_timeout_ms, true);
    if (w == WaitOutcome::kTimeout) return Fail(UploadError::kCompletionTimeout);
    if (w != WaitOutcome::kSatisfied) return Fail(OutcomeError(w));
    UploadError verdict = UploadError::kDeviceRejected;
    if (!slot_downloaded_.load(std::memory_order_acquire) &&
        CheckDeviceVerdict(verdict)) {
      return Fail(verdict);
    }
    Transition(detail::kEvDownloaded);
    SetPredicted(work_.slot, SlotState::kDownloaded);

    // 5. load + activate
    if (options_.activate) {
      if (!IssueOrAbort(Command(LoadSlot{work_.slot}))) {
        return UploadError::kWriteFailed;
      }
      Transition(detail::kEvLoaded);
      if (!IssueOrAbort(Command(ActivateSlot{}))) {
        return UploadError::kWriteFailed;
      }
      Transition(detail::kEvActivated);
      SetPredicted(work_.slot, SlotState::kActive);
    }
    return UploadError::kCancelled;
  }

  // --- writer helpers ---

  bool IssueOrAbort(const Command& cmd) {
    auto r = session_.Channels().Issue(cmd);
    if (r.has_value()) return true;
    FLUFF_LOG_ERROR("Upload", "job %u: %s failed: %s", work_.id,
                    CommandName(cmd), RegistryErrorName(r.get_error()));
    (void)Fail(r.get_error() == RegistryError::kNotConnected
                   ? UploadError::kLinkLost
                   : UploadError::kWriteFailed);
    return false;
  }

  UploadError Fail(UploadError err) {
    const bool stall = (err == UploadError::kStalled ||
                        err == UploadError::kCompletionTimeout);
    if (stall && fsm_.Current() != JobState::kDownloaded &&
        fsm_.Current() != JobState::kLoaded) {
      Transition(detail::kEvStall);
    } else {
      Transition(detail::kEvAbort);
    }
    return err;
  }

  void Transition(uint32_t event_id) {
    const JobState from = fsm_.Current();
    if (fsm_.Dispatch(Event{event_id, nullptr}) ==
        TransitionResult::kTransition) {
      work_.state = fsm_.Current();
      FLUFF_LOG_DEBUG("Upload", "job %u: %s -> %s", work_.id,
                      JobStateName(from), JobStateName(work_.state));
      if (work_.state == JobState::kAnnounced) {
        SetPredicted(work_.slot, SlotState::kInProgress);
      }
      Publish();
    }
  }

  // True if the device has already decided the outcome badly.
  bool CheckDeviceVerdict(UploadError& out) const noexcept {
    const uint8_t s = last_status_.load(std::memory_order_acquire);
    if (s == static_cast<uint8_t>(TransferStatus::kError)) {
      out = UploadError::kDeviceRejected;
      return true;
    }
    if (s == static_cast<uint8_t>(TransferStatus::kTimeout)) {
      out = UploadError::kDeviceTimeout;
      return true;
    }
    return false;
  }

  bool CheckInterrupted(UploadError& out) const noexcept {
    if (cancel_.load(std::memory_order_acquire)) {
      out = UploadError::kCancelled;
      return true;
    }
    if (link_lost_.load(std::memory_order_acquire)) {
      out = UploadError::kLinkLost;
      return true;
    }
    return false;
  }

  static UploadError OutcomeError(WaitOutcome w) noexcept {
    switch (w) {
      case WaitOutcome::kCancelled: return UploadError::kCancelled;
      case WaitOutcome::kLinkLost:  return UploadError::kLinkLost;
      case WaitOutcome::kStalled:   return UploadError::kStalled;
      default:                      return UploadError::kStalled;
    }
  }

  uint32_t Unacked() const noexcept {
    const uint32_t sent = chunks_sent_.load(std::memory_order_acquire);
    const uint32_t acked = acked_.load(std::memory_order_acquire);
    return acked >= sent ? 0U : sent - acked;
  }

  bool IsStalled(uint64_t now_us) const noexcept {
    if (!options_.enable_ack || options_.stall_timeout_ms == 0U) return false;
    if (Unacked() == 0U) return false;
    const uint64_t ref =
        std::max(last_ack_us_.load(std::memory_order_acquire),
                 unacked_since_us_);
    return now_us > ref &&
           (now_us - ref) >
               static_cast<uint64_t>(options_.stall_timeout_ms) * 1000U;
  }

  /**
   * @brief Wait for @p pred, interruptible by cancel and link loss.
   * @param timeout_ms 0 waits without a deadline.
   * @param check_stall Also end the wait when the ack deadline passes.
   */
  template <typename Pred>
  WaitOutcome WaitUntil(Pred pred, uint32_t timeout_ms, bool check_stall) {
    const uint64_t deadline =
        (timeout_ms == 0U)
            ? 0U
            : SteadyNowUs() + static_cast<uint64_t>(timeout_ms) * 1000U;
    std::unique_lock<std::mutex> lock(wake_mtx_);
    for (;;) {
      UploadError reason = UploadError::kCancelled;
      if (CheckInterrupted(reason)) {
        return reason == UploadError::kCancelled ? WaitOutcome::kCancelled
                                                 : WaitOutcome::kLinkLost;
      }
      if (pred()) return WaitOutcome::kSatisfied;
      const uint64_t now = SteadyNowUs();
      if (check_stall && IsStalled(now)) return WaitOutcome::kStalled;
      if (deadline != 0U && now >= deadline) return WaitOutcome::kTimeout;
      (void)wake_cv_.wait_for(lock, std::chrono::milliseconds(kWaitSliceMs));
    }
  }

  /// Interruptible sleep. Returns kTimeout when the full delay elapsed.
  WaitOutcome Pause(uint32_t ms) {
    return WaitUntil([]() { return false; }, ms, false);
  }

  void ReportProgress() {
    if (options_.on_progress == nullptr) return;
    const UploadProgress p{work_.id,          work_.state,
                           work_.bytes_sent,  work_.total_bytes,
                           work_.chunks_sent, work_.chunks_total,
                           acked_.load(std::memory_order_acquire)};
    options_.on_progress(p, options_.progress_ctx);
  }

  // Copies the writer's view into the shared snapshot.
  void Publish() {
    std::lock_guard<std::mutex> lock(job_mtx_);
    PublishLocked();
  }

  void PublishLocked() {
    work_.chunks_acked = std::min(acked_.load(std::memory_order_acquire),
                                  work_.chunks_sent);
    work_.last_ack_us = last_ack_us_.load(std::memory_order_acquire);
    {
      std::lock_guard<std::mutex> slots(slots_mtx_);
      work_.slot_observed = slots_[work_.slot].observed_known;
      work_.observed_slot_state = slots_[work_.slot].observed;
    }
    job_ = work_;
  }

  void ResetSignals(uint8_t slot) {
    cancel_.store(false, std::memory_order_release);
    link_lost_.store(false, std::memory_order_release);
    overload_pending_.store(false, std::memory_order_release);
    slot_downloaded_.store(false, std::memory_order_release);
    acked_.store(0U, std::memory_order_release);
    chunks_sent_.store(0U, std::memory_order_release);
    last_ack_us_.store(0U, std::memory_order_release);
    last_status_.store(kNoStatus, std::memory_order_release);
    job_slot_.store(slot, std::memory_order_release);
    unacked_since_us_ = 0U;
  }

  const UploadJob* FindInHistory(JobId id) const {
    if (id == kInvalidJob) return nullptr;
    for (uint32_t i = 0; i < history_count_; ++i) {
      if (history_[i].id == id) return &history_[i];
    }
    return nullptr;
  }

  // --------------------------------------------------------------------------
  // Slot table
  // --------------------------------------------------------------------------

  expected<void, UploadError> IssueSlotCommand(const CommandResult& cmd) {
    if (!cmd.has_value()) {
      return expected<void, UploadError>::error(UploadError::kInvalidArgument);
    }
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, UploadError>::error(UploadError::kBusy);
    }
    auto r = session_.Channels().Issue(cmd.value());
    if (!r.has_value()) {
      return expected<void, UploadError>::error(
          r.get_error() == RegistryError::kNotConnected
              ? UploadError::kNotConnected
              : UploadError::kWriteFailed);
    }
    return expected<void, UploadError>::success();
  }

  void SetPredicted(uint8_t slot, SlotState s) {
    std::lock_guard<std::mutex> lock(slots_mtx_);
    slots_[slot].predicted = s;
  }

  // --------------------------------------------------------------------------
  // Listeners (dispatcher thread / session transition thread)
  // --------------------------------------------------------------------------

  void Wake() {
    {
      std::lock_guard<std::mutex> lock(wake_mtx_);
    }
    wake_cv_.notify_all();
  }

  static void OnEvent(const NotificationEvent& ev, void* ctx) {
    auto* self = static_cast<UploadController*>(ctx);
    switch (ev.type) {
      case EventType::kTransferAck:
        if (!self->running_.load(std::memory_order_acquire)) return;
        self->acked_.fetch_add(ev.value, std::memory_order_acq_rel);
        self->last_ack_us_.store(SteadyNowUs(), std::memory_order_release);
        break;
      case EventType::kTransferOverload:
        if (!self->running_.load(std::memory_order_acquire)) return;
        self->overload_pending_.store(true, std::memory_order_release);
        break;
      case EventType::kTransferStatus:
        FLUFF_LOG_DEBUG("Upload", "transfer status %s",
                        TransferStatusName(ev.value));
        if (!self->running_.load(std::memory_order_acquire)) return;
        self->last_status_.store(ev.value, std::memory_order_release);
        break;
      case EventType::kSlotInfo: {
        {
          std::lock_guard<std::mutex> lock(self->slots_mtx_);
          SlotRecord& rec = self->slots_[ev.slot];
          rec.observed_known = true;
          rec.observed = ev.slot_state;
          rec.predicted = ev.slot_state;
        }
        FLUFF_LOG_DEBUG("Upload", "slot %u is %s",
                        static_cast<unsigned>(ev.slot),
                        SlotStateName(ev.slot_state));
        if (self->running_.load(std::memory_order_acquire) &&
            ev.slot == self->job_slot_.load(std::memory_order_acquire) &&
            ev.slot_state == SlotState::kDownloaded) {
          self->slot_downloaded_.store(true, std::memory_order_release);
        }
        break;
      }
      default:
        return;
    }
    self->Wake();
  }

  static void OnSessionState(SessionState from, SessionState to, void* ctx) {
    (void)from;
    auto* self = static_cast<UploadController*>(ctx);
    if (to == SessionState::kConnected) return;
    if (!self->running_.load(std::memory_order_acquire)) return;
    self->link_lost_.store(true, std::memory_order_release);
    self->Wake();
  }

  Session& session_;
  SubscriptionId event_sub_ = kInvalidSubscription;

  // Start/cancel serialization.
  std::mutex control_mtx_;
  std::thread writer_;

  // Writer-owned.
  UploadJob work_;
  detail::JobFsmContext fsm_ctx_;
  StateMachine<detail::JobFsmContext, JobState, kJobStateCount> fsm_;
  UploadOptions options_;
  const uint8_t* data_ = nullptr;
  uint64_t unacked_since_us_ = 0;

  // Shared snapshots.
  mutable std::mutex job_mtx_;
  mutable std::condition_variable done_cv_;
  UploadJob job_;
  UploadJob history_[FLUFF_UPLOAD_JOB_HISTORY];
  uint32_t history_next_ = 0;
  uint32_t history_count_ = 0;
  JobId next_id_ = 1U;

  mutable std::mutex slots_mtx_;
  SlotRecord slots_[256];

  // Listener -> writer signals.
  std::mutex wake_mtx_;
  std::condition_variable wake_cv_;
  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_{false};
  std::atomic<bool> link_lost_{false};
  std::atomic<bool> overload_pending_{false};
  std::atomic<bool> slot_downloaded_{false};
  std::atomic<uint32_t> acked_{0};
  std::atomic<uint32_t> chunks_sent_{0};
  std::atomic<uint64_t> last_ack_us_{0};
  std::atomic<uint8_t> last_status_{kNoStatus};
  std::atomic<uint8_t> job_slot_{0};
};

}  // namespace fluff

#endif  // FLUFF_UPLOAD_HPP_
