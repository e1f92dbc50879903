#include "diagnostics/diagnostics.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace landscape {

const char* diagnosticKindName(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::DISTANCE_COMPUTED:      return "distance_computed";
        case DiagnosticKind::MINIMUM_ADMITTED:       return "minimum_admitted";
        case DiagnosticKind::ADMISSION_ROLLED_BACK:  return "admission_rolled_back";
        case DiagnosticKind::INCONSISTENCY_REPAIRED: return "inconsistency_repaired";
        case DiagnosticKind::DISTANCES_FLUSHED:      return "distances_flushed";
        case DiagnosticKind::MINIMA_MERGED:          return "minima_merged";
    }
    return "unknown";
}

Diagnostics::Diagnostics(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : makeNullLogger()) {}

std::shared_ptr<spdlog::logger> Diagnostics::makeNullLogger(const std::string& name) {
    return std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::shared_ptr<spdlog::logger> Diagnostics::makeConsoleLogger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

void Diagnostics::emit(const DiagnosticEvent& event) {
    counts_[static_cast<size_t>(event.kind)]++;
    if (callback_) callback_(event);
}

void Diagnostics::emit(DiagnosticKind kind, MinimumId m1, MinimumId m2, double value) {
    DiagnosticEvent event;
    event.kind = kind;
    event.minimum1 = m1;
    event.minimum2 = m2;
    event.value = value;
    emit(event);
}

size_t Diagnostics::count(DiagnosticKind kind) const {
    return counts_[static_cast<size_t>(kind)];
}

size_t Diagnostics::recordConsistencyPass(size_t inconsistencies, size_t warn_after) {
    if (inconsistencies == 0) {
        inconsistent_streak_ = 0;
        return 0;
    }
    inconsistent_streak_++;
    if (warn_after > 0 && inconsistent_streak_ >= warn_after) {
        SPDLOG_LOGGER_WARN(logger_,
            "distance graph inconsistent in {} consecutive checks; "
            "transition states are probably reported out of order",
            inconsistent_streak_);
    }
    return inconsistent_streak_;
}

void Diagnostics::reset() {
    counts_.fill(0);
    inconsistent_streak_ = 0;
}

} // namespace landscape
