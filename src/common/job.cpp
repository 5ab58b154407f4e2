#include "common/job.hpp"
#include <chrono>
#include <random>
#include <sstream>
#include <iomanip>

Job::Job() : state_(State::PENDING) {}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

void Job::setState(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void Job::setStatus(const std::string& status) {
    StatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        callback = statusCallback_;
    }
    if (callback) {
        callback(status);
    }
}

std::string Job::generateId() const {
    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch());

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << std::hex << now_ms.count();
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }

    return ss.str();
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Job::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

std::string Job::stateToString(State state) {
    switch (state) {
        case State::PENDING:   return "pending";
        case State::RUNNING:   return "running";
        case State::COMPLETED: return "completed";
        case State::FAILED:    return "failed";
        case State::CANCELLED: return "cancelled";
        default:               return "unknown";
    }
}
