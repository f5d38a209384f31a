// Owns the current session and re-establishes it on request.
//
// A single background thread serves reconnect requests one at a time, so the
// factory is never called concurrently by the same supervisor. Requests never
// block the caller: one posted while an attempt is pending or running is
// folded into a single follow-up attempt.
#pragma once
#include "SessionFactory.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace resftp {

struct ReconnectOutcome {
    bool ok = false;
    Error error; // set when !ok
    std::uint64_t attempt = 0;
};

class ReconnectSupervisor {
public:
    enum class State { Idle, Reconnecting, Stopped };

    // Called on the supervisor thread; must return quickly.
    using OutcomeListener = std::function<void(const ReconnectOutcome &)>;

    explicit ReconnectSupervisor(std::shared_ptr<SessionFactory> factory);
    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor &) = delete;
    ReconnectSupervisor &operator=(const ReconnectSupervisor &) = delete;

    void start();
    // Signals shutdown and joins the thread. An attempt already in flight
    // completes first. Idempotent.
    void stop();

    // Synchronous connect on the calling thread; installs the session.
    bool connectNow(Error &err);

    // Non-blocking. Ignored once stopped.
    void requestReconnect();

    // Snapshot of the current session; null before the first successful
    // connect or after releaseSession().
    std::shared_ptr<RemoteSession> currentSession() const;
    // Takes the current session out of the supervisor.
    std::shared_ptr<RemoteSession> releaseSession();

    State state() const;
    std::optional<ReconnectOutcome> lastOutcome() const;
    std::uint64_t attempts() const;

    int addOutcomeListener(OutcomeListener listener);
    void removeOutcomeListener(int id);

    // Waits until no request is pending and no attempt is running.
    bool waitIdle(std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<SessionFactory> factory_;

    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::shared_ptr<RemoteSession> current_;
    State state_ = State::Idle;
    bool pending_ = false;
    bool stopRequested_ = false;
    bool started_ = false;
    std::uint64_t attempts_ = 0;
    std::optional<ReconnectOutcome> lastOutcome_;

    std::mutex listenersMutex_;
    std::map<int, OutcomeListener> listeners_;
    int nextListenerId_ = 1;

    // Serialises factory calls between connectNow() and the loop.
    std::mutex connectMutex_;

    std::thread worker_;

    void run();
    void publish(const ReconnectOutcome &outcome);
};

const char *supervisorStateName(ReconnectSupervisor::State state);

} // namespace resftp
