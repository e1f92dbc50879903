#pragma once

#include "landscape/types.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace landscape {

// ─── Diagnostic Events ─────────────────────────────────────────
// Structured events emitted by the cache and the distance graph.
// Counted per kind and forwarded to an optional callback.

enum class DiagnosticKind {
    DISTANCE_COMPUTED,
    MINIMUM_ADMITTED,
    ADMISSION_ROLLED_BACK,
    INCONSISTENCY_REPAIRED,
    DISTANCES_FLUSHED,
    MINIMA_MERGED,
};

constexpr size_t kDiagnosticKindCount = 6;

const char* diagnosticKindName(DiagnosticKind kind);

struct DiagnosticEvent {
    DiagnosticKind kind = DiagnosticKind::DISTANCE_COMPUTED;
    MinimumId minimum1 = 0;
    MinimumId minimum2 = 0;
    double value = 0.0;  // distance, weight or entry count depending on kind
};

// ─── Diagnostics ───────────────────────────────────────────────
// Per-session diagnostics sink. Owns the session logger; nothing is
// looked up in the spdlog registry.

class Diagnostics {
public:
    using EventCallback = std::function<void(const DiagnosticEvent&)>;

    /// Logger that discards everything.
    static std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "landscape");

    /// Colored stderr logger. Not registered globally.
    static std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name = "landscape");

    explicit Diagnostics(std::shared_ptr<spdlog::logger> logger = makeNullLogger());

    spdlog::logger& logger() const { return *logger_; }
    const std::shared_ptr<spdlog::logger>& loggerPtr() const { return logger_; }

    void setEventCallback(EventCallback cb) { callback_ = std::move(cb); }

    void emit(const DiagnosticEvent& event);
    void emit(DiagnosticKind kind, MinimumId m1 = 0, MinimumId m2 = 0, double value = 0.0);

    size_t count(DiagnosticKind kind) const;

    /// Record the outcome of one consistency pass. Returns the number of
    /// consecutive passes that found inconsistencies (0 if this one was clean).
    /// Logs a warning once the streak reaches `warn_after`.
    size_t recordConsistencyPass(size_t inconsistencies, size_t warn_after);

    size_t inconsistentPassStreak() const { return inconsistent_streak_; }

    void reset();

private:
    std::shared_ptr<spdlog::logger> logger_;
    EventCallback callback_;
    std::array<size_t, kDiagnosticKindCount> counts_{};
    size_t inconsistent_streak_ = 0;
};

} // namespace landscape
