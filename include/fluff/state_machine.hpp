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
 * @file state_machine.hpp
 * @brief Table-driven flat state machine keyed by an enum.
 *
 * States are registered with a handler and optional entry/exit actions. A
 * handler either consumes an event, ignores it, or requests a transition to
 * another state. Any transition not requested by a handler is impossible,
 * so the handler table is the complete list of legal edges.
 *
 * Not thread-safe. Owners serialize Dispatch() with their own lock.
 */

#ifndef FLUFF_STATE_MACHINE_HPP_
#define FLUFF_STATE_MACHINE_HPP_

#include "fluff/platform.hpp"

#include <cstdint>

namespace fluff {

// ============================================================================
// Event
// ============================================================================

struct Event {
  uint32_t id;
  const void* data;  ///< Optional payload, nullptr if unused.
};

enum class TransitionResult : uint8_t {
  kHandled,    ///< consumed, no state change
  kUnhandled,  ///< not valid in this state
  kTransition  ///< RequestTransition() was called
};

// ============================================================================
// StateConfig
// ============================================================================

template <typename Context>
struct StateConfig {
  using HandlerFn = TransitionResult (*)(Context& ctx, const Event& event);
  using ActionFn = void (*)(Context& ctx);

  const char* name;    ///< static lifetime
  HandlerFn handler;
  ActionFn on_entry;   ///< nullptr if none
  ActionFn on_exit;    ///< nullptr if none
};

// ============================================================================
// StateMachine
// ============================================================================

/**
 * @brief Flat state machine over an enum of states.
 *
 * @tparam Context  User context passed to handlers and actions.
 * @tparam StateId  Enum class whose values are 0..MaxStates-1.
 * @tparam MaxStates Number of states.
 *
 * @code
 *   struct Ctx { StateMachine<Ctx, Light, 2>* sm; };
 *   Ctx ctx{};
 *   StateMachine<Ctx, Light, 2> sm(ctx);
 *   ctx.sm = &sm;
 *   sm.AddState(Light::kOff, {"Off", OffHandler, nullptr, nullptr});
 *   sm.AddState(Light::kOn, {"On", OnHandler, nullptr, nullptr});
 *   sm.Start(Light::kOff);
 *   sm.Dispatch({kEvToggle, nullptr});
 * @endcode
 */
template <typename Context, typename StateId, uint32_t MaxStates>
class StateMachine final {
 public:
  explicit StateMachine(Context& ctx) noexcept
      : ctx_(ctx),
        current_(static_cast<StateId>(0)),
        pending_(static_cast<StateId>(0)),
        has_pending_(false),
        started_(false),
        transitions_(0),
        states_{} {}

  StateMachine(const StateMachine&) = delete;
  StateMachine& operator=(const StateMachine&) = delete;

  void AddState(StateId id, const StateConfig<Context>& config) noexcept {
    FLUFF_ASSERT(!started_);
    FLUFF_ASSERT(Index(id) < MaxStates);
    states_[Index(id)] = config;
  }

  /// Enters @p initial and runs its entry action.
  void Start(StateId initial) noexcept {
    FLUFF_ASSERT(!started_);
    started_ = true;
    current_ = initial;
    has_pending_ = false;
    RunEntry(initial);
  }

  /// Returns to the not-started phase without running exit actions, so the
  /// machine can be started again for a new run.
  void Reset() noexcept {
    started_ = false;
    has_pending_ = false;
    transitions_ = 0;
  }

  /**
   * @brief Offer an event to the current state.
   * @return kUnhandled if the current state rejected it.
   */
  TransitionResult Dispatch(const Event& event) noexcept {
    FLUFF_ASSERT(started_);
    const auto& sc = states_[Index(current_)];
    if (sc.handler == nullptr) {
      return TransitionResult::kUnhandled;
    }
    const TransitionResult result = sc.handler(ctx_, event);
    if (result == TransitionResult::kTransition) {
      FLUFF_ASSERT(has_pending_);
      has_pending_ = false;
      TransitionTo(pending_);
    }
    return result;
  }

  /// Call from a handler and return its result.
  TransitionResult RequestTransition(StateId target) noexcept {
    pending_ = target;
    has_pending_ = true;
    return TransitionResult::kTransition;
  }

  StateId Current() const noexcept { return current_; }

  const char* CurrentName() const noexcept { return StateName(current_); }

  const char* StateName(StateId id) const noexcept {
    const char* n = states_[Index(id)].name;
    return (n != nullptr) ? n : "";
  }

  bool IsIn(StateId id) const noexcept { return started_ && current_ == id; }
  bool IsStarted() const noexcept { return started_; }
  uint32_t TransitionCount() const noexcept { return transitions_; }

 private:
  static uint32_t Index(StateId id) noexcept {
    return static_cast<uint32_t>(id);
  }

  void RunEntry(StateId id) noexcept {
    const auto& sc = states_[Index(id)];
    if (sc.on_entry != nullptr) sc.on_entry(ctx_);
  }

  void RunExit(StateId id) noexcept {
    const auto& sc = states_[Index(id)];
    if (sc.on_exit != nullptr) sc.on_exit(ctx_);
  }

  // Self-transitions run exit then entry.
  void TransitionTo(StateId target) noexcept {
    RunExit(current_);
    current_ = target;
    ++transitions_;
    RunEntry(target);
  }

  Context& ctx_;
  StateId current_;
  StateId pending_;
  bool has_pending_;
  bool started_;
  uint32_t transitions_;
  StateConfig<Context> states_[MaxStates];
};

}  // namespace fluff

#endif  // FLUFF_STATE_MACHINE_HPP_
