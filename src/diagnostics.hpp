#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dmsim {

enum class Severity {
    kInfo,
    kWarning,
};

struct DiagnosticRecord {
    Severity severity = Severity::kWarning;
    std::string category;
    std::string message;
};

// Per-trial record of what a replay did, in application order.
struct ExecutionLog {
    int trial = 0;
    double time = 0.0;
    std::string category;
    std::string message;
};

using LogSink = std::function<void(const DiagnosticRecord&)>;

// Installs the process-wide diagnostic sink and returns the previous one.
// An empty sink restores the default, which writes warnings to stderr.
LogSink set_diagnostic_sink(LogSink sink);

void emit_diagnostic(const DiagnosticRecord& record);

void warn(const std::string& category, const std::string& message);

// Collects every diagnostic emitted while it is alive.
class ScopedDiagnosticCapture {
  public:
    ScopedDiagnosticCapture();
    ~ScopedDiagnosticCapture();

    ScopedDiagnosticCapture(const ScopedDiagnosticCapture&) = delete;
    ScopedDiagnosticCapture& operator=(const ScopedDiagnosticCapture&) = delete;

    const std::vector<DiagnosticRecord>& records() const;
    std::size_t count(const std::string& category) const;

  private:
    std::shared_ptr<std::vector<DiagnosticRecord>> records_;
    LogSink previous_;
};

}  // namespace dmsim
