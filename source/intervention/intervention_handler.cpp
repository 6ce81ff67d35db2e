#include "intervention/intervention_handler.hpp"
#include "utils/server_log.hpp"

#include <algorithm>
#include <mutex>

namespace intervention {

const char *state_name(InterventionState state) {
    switch (state) {
    case InterventionState::Running:
        return "Running";
    case InterventionState::WaitingForHuman:
        return "WaitingForHuman";
    case InterventionState::Resuming:
        return "Resuming";
    case InterventionState::TimedOut:
        return "TimedOut";
    case InterventionState::Cancelled:
        return "Cancelled";
    }
    return "Running";
}

std::string describe_reason(const InterventionReason &reason) {
    std::string label;
    switch (reason.kind) {
    case ReasonKind::Captcha:
        label = "CAPTCHA detected";
        break;
    case ReasonKind::TwoFactor:
        label = "Two-factor authentication required";
        break;
    case ReasonKind::Login:
        label = "Login required";
        break;
    case ReasonKind::ManualPause:
        label = "Paused for manual interaction";
        break;
    case ReasonKind::Other:
        label = "Human intervention required";
        break;
    }
    if (reason.detail.empty()) {
        return label;
    }
    return label + ": " + reason.detail;
}

InterventionState InterventionHandler::state() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_;
}

std::optional<std::string> InterventionHandler::current_reason() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (state_ != InterventionState::WaitingForHuman || !reason_) {
        return std::nullopt;
    }
    return describe_reason(*reason_);
}

std::optional<InterventionOutcome> InterventionHandler::last_outcome() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return last_outcome_;
}

void InterventionHandler::enter_waiting(const InterventionReason &reason) {
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        state_ = InterventionState::WaitingForHuman;
        reason_ = reason;
    }
    state_changed_.notify_all();
    server_log::info("Intervention: waiting for human (" + describe_reason(reason) + ")");
}

void InterventionHandler::request_intervention(const InterventionReason &reason) {
    enter_waiting(reason);
}

void InterventionHandler::pause() {
    InterventionReason reason;
    reason.kind = ReasonKind::ManualPause;
    reason.detail = "automation paused by the client";
    enter_waiting(reason);
}

void InterventionHandler::resume() {
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        state_ = InterventionState::Running;
        reason_.reset();
    }
    state_changed_.notify_all();
    server_log::info("Intervention: resumed");
}

void InterventionHandler::complete(bool success, const std::string &message) {
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        InterventionOutcome outcome;
        outcome.success = success;
        outcome.message = message;
        outcome.completed_at = std::chrono::system_clock::now();
        last_outcome_ = outcome;
        state_ = InterventionState::Resuming;
        reason_.reset();
    }
    state_changed_.notify_all();
    server_log::info(std::string("Intervention: completed (") + (success ? "success" : "failure") + ")");
}

void InterventionHandler::cancel() {
    {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        state_ = InterventionState::Cancelled;
        reason_.reset();
    }
    state_changed_.notify_all();
}

bool InterventionHandler::acknowledge_resume() {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (state_ != InterventionState::Resuming) {
        return false;
    }
    state_ = InterventionState::Running;
    return true;
}

bool InterventionHandler::is_blocking() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_ == InterventionState::WaitingForHuman;
}

InterventionState InterventionHandler::wait_for_human(std::chrono::milliseconds timeout,
                                                      const std::function<bool()> &resolved_check,
                                                      std::chrono::milliseconds poll_interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        {
            std::unique_lock<std::shared_mutex> lock(state_mutex_);
            auto wake_at = std::min(deadline, std::chrono::steady_clock::now() + poll_interval);
            state_changed_.wait_until(lock, wake_at,
                                      [this] { return state_ != InterventionState::WaitingForHuman; });
            if (state_ != InterventionState::WaitingForHuman) {
                return state_;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                state_ = InterventionState::TimedOut;
                reason_.reset();
                lock.unlock();
                state_changed_.notify_all();
                server_log::warn("Intervention: timed out waiting for human");
                return InterventionState::TimedOut;
            }
        }

        // The check may talk to the browser, so it runs without the lock.
        if (resolved_check && resolved_check()) {
            resume();
            return InterventionState::Running;
        }
    }
}

} // namespace intervention
