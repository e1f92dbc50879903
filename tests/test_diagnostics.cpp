#include <gtest/gtest.h>
#include "diagnostics/diagnostics.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <sstream>
#include <vector>

using namespace landscape;

TEST(DiagnosticsTest, CountsEventsPerKind) {
    Diagnostics diag;
    diag.emit(DiagnosticKind::DISTANCE_COMPUTED, 1, 2, 0.5);
    diag.emit(DiagnosticKind::DISTANCE_COMPUTED, 1, 3, 0.7);
    diag.emit(DiagnosticKind::MINIMUM_ADMITTED, 1);

    EXPECT_EQ(diag.count(DiagnosticKind::DISTANCE_COMPUTED), 2u);
    EXPECT_EQ(diag.count(DiagnosticKind::MINIMUM_ADMITTED), 1u);
    EXPECT_EQ(diag.count(DiagnosticKind::MINIMA_MERGED), 0u);

    diag.reset();
    EXPECT_EQ(diag.count(DiagnosticKind::DISTANCE_COMPUTED), 0u);
}

TEST(DiagnosticsTest, ForwardsEventsToCallback) {
    Diagnostics diag;
    std::vector<DiagnosticEvent> seen;
    diag.setEventCallback([&](const DiagnosticEvent& e) { seen.push_back(e); });

    diag.emit(DiagnosticKind::MINIMA_MERGED, 4, 9);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].kind, DiagnosticKind::MINIMA_MERGED);
    EXPECT_EQ(seen[0].minimum1, 4u);
    EXPECT_EQ(seen[0].minimum2, 9u);
}

TEST(DiagnosticsTest, KindNames) {
    EXPECT_STREQ(diagnosticKindName(DiagnosticKind::ADMISSION_ROLLED_BACK),
                 "admission_rolled_back");
    EXPECT_STREQ(diagnosticKindName(DiagnosticKind::DISTANCES_FLUSHED), "distances_flushed");
}

TEST(DiagnosticsTest, WarnsOnRepeatedInconsistency) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("test", sink);
    Diagnostics diag(logger);

    EXPECT_EQ(diag.recordConsistencyPass(2, 3), 1u);
    EXPECT_EQ(diag.recordConsistencyPass(1, 3), 2u);
    EXPECT_TRUE(out.str().empty());

    EXPECT_EQ(diag.recordConsistencyPass(1, 3), 3u);
    logger->flush();
    EXPECT_NE(out.str().find("3 consecutive checks"), std::string::npos);

    EXPECT_EQ(diag.recordConsistencyPass(0, 3), 0u);
    EXPECT_EQ(diag.inconsistentPassStreak(), 0u);
}
