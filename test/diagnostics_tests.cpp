#include "diagnostics.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace dmsim {
namespace {

TEST(DiagnosticsTests, CaptureCollectsWarnings) {
    ScopedDiagnosticCapture capture;
    warn("MissingSampler", "first");
    warn("Other", "second");
    warn("MissingSampler", "third");

    ASSERT_EQ(capture.records().size(), 3u);
    EXPECT_EQ(capture.count("MissingSampler"), 2u);
    EXPECT_EQ(capture.records()[1].message, "second");
}

TEST(DiagnosticsTests, CaptureRestoresPreviousSink) {
    std::vector<std::string> seen;
    LogSink previous = set_diagnostic_sink([&](const DiagnosticRecord& record) {
        seen.push_back(record.category);
    });
    {
        ScopedDiagnosticCapture capture;
        warn("Inner", "captured");
        EXPECT_EQ(capture.count("Inner"), 1u);
    }
    warn("Outer", "forwarded");
    set_diagnostic_sink(std::move(previous));

    EXPECT_EQ(seen, (std::vector<std::string>{"Outer"}));
}

TEST(DiagnosticsTests, InfoRecordsKeepSeverity) {
    ScopedDiagnosticCapture capture;
    emit_diagnostic(DiagnosticRecord{Severity::kInfo, "Trace", "note"});
    ASSERT_EQ(capture.records().size(), 1u);
    EXPECT_EQ(capture.records()[0].severity, Severity::kInfo);
}

}  // namespace
}  // namespace dmsim
