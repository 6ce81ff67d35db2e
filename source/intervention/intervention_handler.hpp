#ifndef WEBPUPPET_MCP_INTERVENTION_HANDLER_HPP
#define WEBPUPPET_MCP_INTERVENTION_HANDLER_HPP

// Human-in-the-loop state machine.
//
//   Running --pause()/request_intervention()--> WaitingForHuman
//   WaitingForHuman --complete()--> Resuming --acknowledge_resume()--> Running
//   any --resume()--> Running
//   WaitingForHuman --deadline in wait_for_human()--> TimedOut
//   any --cancel()--> Cancelled
//
// TimedOut and Cancelled end the episode; the next pause(),
// request_intervention() or resume() starts a new one.
// All members are safe to call from concurrent threads.

#include <chrono>
#include <condition_variable>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>

namespace intervention {

enum class InterventionState {
    Running,
    WaitingForHuman,
    Resuming,
    TimedOut,
    Cancelled
};

const char *state_name(InterventionState state);

enum class ReasonKind {
    Captcha,
    TwoFactor,
    Login,
    ManualPause,
    Other
};

struct InterventionReason {
    ReasonKind kind = ReasonKind::Other;
    std::string detail;
};

// e.g. "Login required: claude (sign in to continue)".
std::string describe_reason(const InterventionReason &reason);

struct InterventionOutcome {
    bool success = false;
    std::string message;
    std::chrono::system_clock::time_point completed_at;
};

class InterventionHandler {
public:
    InterventionState state() const;

    // Description of the pending reason; empty unless WaitingForHuman.
    std::optional<std::string> current_reason() const;

    // Outcome recorded by the most recent complete(), if any.
    std::optional<InterventionOutcome> last_outcome() const;

    // Signal from a collaborator that a human is needed.
    void request_intervention(const InterventionReason &reason);

    // External pause: hand the browser to a human.
    void pause();

    // Back to Running; clears the pending reason.
    void resume();

    // Record the human's outcome and signal resumption (-> Resuming).
    void complete(bool success, const std::string &message);

    // Abort the episode and release any waiter (-> Cancelled).
    void cancel();

    // Resuming -> Running. Returns true if a transition happened.
    bool acknowledge_resume();

    // True while automation must not proceed.
    bool is_blocking() const;

    // Block until the state leaves WaitingForHuman. resolved_check, if set, is
    // polled every poll_interval; returning true resumes automatically. When
    // the timeout passes first the state becomes TimedOut. Returns the state
    // observed on exit.
    InterventionState wait_for_human(std::chrono::milliseconds timeout,
                                     const std::function<bool()> &resolved_check = nullptr,
                                     std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

private:
    void enter_waiting(const InterventionReason &reason);

    mutable std::shared_mutex state_mutex_;
    std::condition_variable_any state_changed_;
    InterventionState state_ = InterventionState::Running;
    std::optional<InterventionReason> reason_;
    std::optional<InterventionOutcome> last_outcome_;
};

} // namespace intervention

#endif // WEBPUPPET_MCP_INTERVENTION_HANDLER_HPP
