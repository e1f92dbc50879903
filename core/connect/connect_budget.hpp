#pragma once

#include <chrono>

namespace landscape {

/// Limits a connection run by wall-clock time and by the number of
/// local connect attempts. Attempts are the expensive unit; merges and
/// consistency passes are free.
class ConnectBudget {
public:
    enum class Limit { NONE, ATTEMPTS, TIME };

    ConnectBudget(double max_seconds, int max_attempts)
        : max_seconds_(max_seconds), max_attempts_(max_attempts),
          start_time_(std::chrono::steady_clock::now()) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        attempts_ = 0;
    }

    void recordAttempt() { attempts_++; }

    /// The limit that has been reached, if any. Attempts are checked first.
    Limit exhausted() const {
        if (attempts_ >= max_attempts_) return Limit::ATTEMPTS;
        if (elapsedSeconds() >= max_seconds_) return Limit::TIME;
        return Limit::NONE;
    }

    bool canContinue() const { return exhausted() == Limit::NONE; }

    double elapsedSeconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    }

    int attempts() const { return attempts_; }
    int remainingAttempts() const { return attempts_ < max_attempts_ ? max_attempts_ - attempts_ : 0; }

private:
    double max_seconds_;
    int max_attempts_;
    int attempts_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

inline const char* limitName(ConnectBudget::Limit limit) {
    switch (limit) {
        case ConnectBudget::Limit::NONE:     return "none";
        case ConnectBudget::Limit::ATTEMPTS: return "attempt limit";
        case ConnectBudget::Limit::TIME:     return "time limit";
    }
    return "unknown";
}

} // namespace landscape
