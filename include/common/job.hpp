#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <atomic>

// Callback type definitions
using StatusCallback = std::function<void(const std::string& status)>;

// Base class for a synchronous unit of work. run() executes on the caller's
// thread; cancel() may be called from elsewhere (e.g. a signal handler through
// cancelFlag()) and is honored at the job's next safe point.
class Job {
public:
    enum class State {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    Job();
    virtual ~Job() = default;

    virtual bool run() = 0;

    void cancel() { cancelRequested_.store(true); }
    bool isCancelRequested() const { return cancelRequested_.load(); }
    const std::atomic<bool>& cancelFlag() const { return cancelRequested_; }

    bool isRunning() const { return getState() == State::RUNNING; }
    bool isCompleted() const { return getState() == State::COMPLETED; }
    bool isFailed() const { return getState() == State::FAILED; }
    bool isCancelled() const { return getState() == State::CANCELLED; }

    State getState() const;
    std::string getStatus() const;
    std::string getError() const;
    std::string getId() const;

    void setStatusCallback(StatusCallback callback) { statusCallback_ = callback; }

    static std::string stateToString(State state);

protected:
    void setError(const std::string& error);
    void setState(State state);
    void setStatus(const std::string& status);
    void setId(const std::string& id) { id_ = id; }
    std::string generateId() const;

    std::string id_;
    State state_{State::PENDING};
    std::string status_{"pending"};
    std::string error_;
    StatusCallback statusCallback_;
    std::atomic<bool> cancelRequested_{false};
    mutable std::mutex mutex_;
};
