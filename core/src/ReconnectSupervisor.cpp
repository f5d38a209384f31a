#include "resftp/ReconnectSupervisor.hpp"
#include "resftp/Logging.hpp"

#include <utility>
#include <vector>

namespace resftp {

const char *supervisorStateName(ReconnectSupervisor::State state) {
    switch (state) {
    case ReconnectSupervisor::State::Idle:
        return "Idle";
    case ReconnectSupervisor::State::Reconnecting:
        return "Reconnecting";
    case ReconnectSupervisor::State::Stopped:
        return "Stopped";
    }
    return "Unknown";
}

ReconnectSupervisor::ReconnectSupervisor(std::shared_ptr<SessionFactory> factory)
    : factory_(std::move(factory)) {}

ReconnectSupervisor::~ReconnectSupervisor() { stop(); }

void ReconnectSupervisor::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (started_ || stopRequested_)
        return;
    started_ = true;
    worker_ = std::thread(&ReconnectSupervisor::run, this);
}

void ReconnectSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopRequested_ = true;
        pending_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        state_ = State::Stopped;
    }
    cv_.notify_all();
}

bool ReconnectSupervisor::connectNow(Error &err) {
    std::unique_ptr<RemoteSession> fresh;
    {
        std::lock_guard<std::mutex> ck(connectMutex_);
        fresh = factory_->connect(err);
    }
    if (!fresh)
        return false;
    std::shared_ptr<RemoteSession> shared(std::move(fresh));
    std::lock_guard<std::mutex> lk(mtx_);
    current_ = std::move(shared);
    return true;
}

void ReconnectSupervisor::requestReconnect() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopRequested_)
            return;
        if (pending_) {
            qCDebug(rsReconnect) << "reconnect already pending; coalesced";
            return;
        }
        pending_ = true;
    }
    cv_.notify_all();
}

std::shared_ptr<RemoteSession> ReconnectSupervisor::currentSession() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return current_;
}

std::shared_ptr<RemoteSession> ReconnectSupervisor::releaseSession() {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::exchange(current_, nullptr);
}

ReconnectSupervisor::State ReconnectSupervisor::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

std::optional<ReconnectOutcome> ReconnectSupervisor::lastOutcome() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastOutcome_;
}

std::uint64_t ReconnectSupervisor::attempts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return attempts_;
}

int ReconnectSupervisor::addOutcomeListener(OutcomeListener listener) {
    std::lock_guard<std::mutex> lk(listenersMutex_);
    const int id = nextListenerId_++;
    listeners_[id] = std::move(listener);
    return id;
}

void ReconnectSupervisor::removeOutcomeListener(int id) {
    std::lock_guard<std::mutex> lk(listenersMutex_);
    listeners_.erase(id);
}

bool ReconnectSupervisor::waitIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this]() {
        return !pending_ && state_ != State::Reconnecting;
    });
}

void ReconnectSupervisor::publish(const ReconnectOutcome &outcome) {
    std::vector<OutcomeListener> snapshot;
    {
        std::lock_guard<std::mutex> lk(listenersMutex_);
        snapshot.reserve(listeners_.size());
        for (const auto &kv : listeners_)
            snapshot.push_back(kv.second);
    }
    for (const auto &cb : snapshot) {
        if (cb)
            cb(outcome);
    }
}

void ReconnectSupervisor::run() {
    for (;;) {
        std::uint64_t attempt = 0;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [this]() { return stopRequested_ || pending_; });
            if (stopRequested_)
                return;
            pending_ = false;
            state_ = State::Reconnecting;
            attempt = ++attempts_;
        }
        cv_.notify_all();
        qCInfo(rsReconnect) << "reconnecting, attempt" << attempt;

        ReconnectOutcome outcome;
        outcome.attempt = attempt;
        std::unique_ptr<RemoteSession> fresh;
        {
            std::lock_guard<std::mutex> ck(connectMutex_);
            fresh = factory_->connect(outcome.error);
        }
        outcome.ok = static_cast<bool>(fresh);

        std::shared_ptr<RemoteSession> replaced;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (outcome.ok) {
                // The old session stays alive for operations still using it.
                replaced = std::exchange(current_,
                                         std::shared_ptr<RemoteSession>(std::move(fresh)));
                outcome.error.clear();
            }
            lastOutcome_ = outcome;
        }
        if (outcome.ok) {
            qCInfo(rsReconnect) << "reconnected, attempt" << attempt;
        } else {
            qCWarning(rsReconnect) << "reconnect failed, attempt" << attempt
                                   << qs(outcome.error.message);
        }
        replaced.reset();
        publish(outcome);

        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (state_ == State::Reconnecting)
                state_ = State::Idle;
        }
        cv_.notify_all();
    }
}

} // namespace resftp
