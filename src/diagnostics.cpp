#include "diagnostics.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

namespace dmsim {

namespace {

std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& installed_sink() {
    static LogSink sink;
    return sink;
}

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::kInfo:
            return "info";
        case Severity::kWarning:
            return "warning";
    }
    return "unknown";
}

void write_to_stderr(const DiagnosticRecord& record) {
    std::cerr << "[" << severity_name(record.severity) << "] "
              << record.category << ": " << record.message << std::endl;
}

}  // namespace

LogSink set_diagnostic_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    LogSink previous = std::move(installed_sink());
    installed_sink() = std::move(sink);
    return previous;
}

void emit_diagnostic(const DiagnosticRecord& record) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    const LogSink& sink = installed_sink();
    if (sink) {
        sink(record);
    } else {
        write_to_stderr(record);
    }
}

void warn(const std::string& category, const std::string& message) {
    emit_diagnostic(DiagnosticRecord{Severity::kWarning, category, message});
}

ScopedDiagnosticCapture::ScopedDiagnosticCapture()
    : records_(std::make_shared<std::vector<DiagnosticRecord>>()) {
    auto records = records_;
    previous_ = set_diagnostic_sink([records](const DiagnosticRecord& record) {
        records->push_back(record);
    });
}

ScopedDiagnosticCapture::~ScopedDiagnosticCapture() {
    set_diagnostic_sink(std::move(previous_));
}

const std::vector<DiagnosticRecord>& ScopedDiagnosticCapture::records() const {
    return *records_;
}

std::size_t ScopedDiagnosticCapture::count(const std::string& category) const {
    return static_cast<std::size_t>(std::count_if(
        records_->begin(),
        records_->end(),
        [&](const DiagnosticRecord& record) { return record.category == category; }
    ));
}

}  // namespace dmsim
