// Tests for the human-in-the-loop state machine.

#include "intervention/intervention_handler.hpp"

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using intervention::InterventionHandler;
using intervention::InterventionState;

namespace test_intervention {

static bool check(bool condition, const std::string &test_description) {
    if (condition) {
        std::cout << "  OK: " << test_description << std::endl;
    } else {
        std::cout << "  FAIL: " << test_description << std::endl;
    }
    return condition;
}

// Test: a fresh handler runs and does not block.
static bool test_initial_state() {
    InterventionHandler handler;
    bool success = handler.state() == InterventionState::Running && !handler.is_blocking() &&
                   !handler.current_reason() && !handler.last_outcome() && !handler.acknowledge_resume();
    return check(success, "New handler is Running with no reason or outcome");
}

// Test: pause, complete, acknowledge.
static bool test_pause_complete_cycle() {
    InterventionHandler handler;
    handler.pause();
    bool waiting = handler.state() == InterventionState::WaitingForHuman && handler.is_blocking() &&
                   handler.current_reason().value_or("") ==
                       "Paused for manual interaction: automation paused by the client";

    handler.complete(true, "done");
    bool resuming = handler.state() == InterventionState::Resuming && !handler.is_blocking() &&
                    !handler.current_reason() && handler.last_outcome() && handler.last_outcome()->success &&
                    handler.last_outcome()->message == "done";

    bool acknowledged = handler.acknowledge_resume() && handler.state() == InterventionState::Running &&
                        !handler.acknowledge_resume();
    return check(waiting && resuming && acknowledged, "pause -> complete -> acknowledge_resume");
}

// Test: request_intervention carries the reason text.
static bool test_request_reason() {
    InterventionHandler handler;
    intervention::InterventionReason reason;
    reason.kind = intervention::ReasonKind::Captcha;
    reason.detail = "grok";
    handler.request_intervention(reason);

    intervention::InterventionReason bare;
    bare.kind = intervention::ReasonKind::TwoFactor;
    bool success = handler.current_reason().value_or("") == "CAPTCHA detected: grok" &&
                   intervention::describe_reason(bare) == "Two-factor authentication required";
    return check(success, "Requested intervention exposes its reason");
}

// Test: resume from any state returns to Running.
static bool test_resume_anywhere() {
    InterventionHandler handler;
    handler.pause();
    handler.resume();
    bool from_waiting = handler.state() == InterventionState::Running && !handler.current_reason();
    handler.cancel();
    bool cancelled = handler.state() == InterventionState::Cancelled && !handler.is_blocking();
    handler.resume();
    return check(from_waiting && cancelled && handler.state() == InterventionState::Running,
                 "resume returns to Running from WaitingForHuman and Cancelled");
}

// Test: waiting past the deadline times out.
static bool test_wait_times_out() {
    InterventionHandler handler;
    handler.pause();
    auto started = std::chrono::steady_clock::now();
    InterventionState observed = handler.wait_for_human(std::chrono::milliseconds(100), nullptr,
                                                        std::chrono::milliseconds(20));
    auto elapsed = std::chrono::steady_clock::now() - started;
    bool success = observed == InterventionState::TimedOut && handler.state() == InterventionState::TimedOut &&
                   !handler.current_reason() && elapsed >= std::chrono::milliseconds(100);
    return check(success, "wait_for_human times out after the deadline");
}

// Test: waiting when nothing is pending returns immediately.
static bool test_wait_not_waiting() {
    InterventionHandler handler;
    InterventionState observed = handler.wait_for_human(std::chrono::seconds(5));
    return check(observed == InterventionState::Running, "wait_for_human returns at once when Running");
}

// Test: the resolved check resumes automatically.
static bool test_wait_resolved_check() {
    InterventionHandler handler;
    handler.pause();
    int polls = 0;
    InterventionState observed = handler.wait_for_human(
        std::chrono::seconds(5), [&polls] { return ++polls >= 3; }, std::chrono::milliseconds(10));
    bool success = observed == InterventionState::Running && handler.state() == InterventionState::Running &&
                   polls == 3;
    return check(success, "wait_for_human resumes when the resolved check passes");
}

// Test: complete from another thread wakes the waiter.
static bool test_wait_completed_elsewhere() {
    InterventionHandler handler;
    handler.pause();
    std::thread completer([&handler] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        handler.complete(true, "solved");
    });
    InterventionState observed = handler.wait_for_human(std::chrono::seconds(5));
    completer.join();
    return check(observed == InterventionState::Resuming, "wait_for_human wakes on complete from another thread");
}

// Test: cancel releases the waiter.
static bool test_wait_cancelled() {
    InterventionHandler handler;
    handler.pause();
    std::thread canceller([&handler] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        handler.cancel();
    });
    InterventionState observed = handler.wait_for_human(std::chrono::seconds(5));
    canceller.join();
    return check(observed == InterventionState::Cancelled, "cancel releases a pending wait");
}

// Test: concurrent readers and writers always see a valid state.
static bool test_concurrent_access() {
    InterventionHandler handler;
    std::atomic<bool> stop{false};
    std::atomic<int> invalid{0};

    std::vector<std::thread> readers;
    for (int index = 0; index < 4; ++index) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                InterventionState current = handler.state();
                std::string name = intervention::state_name(current);
                if (name.empty()) {
                    invalid++;
                }
                std::optional<std::string> reason = handler.current_reason();
                if (reason && reason->empty()) {
                    invalid++;
                }
            }
        });
    }

    std::thread writer([&] {
        for (int round = 0; round < 500; ++round) {
            handler.pause();
            handler.complete(round % 2 == 0, "round");
            handler.acknowledge_resume();
        }
    });

    writer.join();
    stop = true;
    for (auto &reader : readers) {
        reader.join();
    }
    bool success = invalid.load() == 0 && handler.state() == InterventionState::Running;
    return check(success, "Concurrent readers and a writer observe consistent state");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initial_state();
    all_passed &= test_pause_complete_cycle();
    all_passed &= test_request_reason();
    all_passed &= test_resume_anywhere();
    all_passed &= test_wait_times_out();
    all_passed &= test_wait_not_waiting();
    all_passed &= test_wait_resolved_check();
    all_passed &= test_wait_completed_elsewhere();
    all_passed &= test_wait_cancelled();
    all_passed &= test_concurrent_access();
    return all_passed;
}

} // namespace test_intervention
