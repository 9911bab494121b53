#include <flexgrid/core/diagnostics.h>
#include <flexgrid/core/config.h>

#include <sstream>

namespace flexgrid::core {

namespace {

template <typename Pred>
std::vector<DiagnosticEvent> select(const std::vector<DiagnosticEvent>& events, Pred pred) {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events) {
        if (pred(e)) result.push_back(e);
    }
    return result;
}

}  // namespace

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Config:   return "config";
        case Stage::Measure:  return "measure";
        case Stage::Allocate: return "allocate";
        case Stage::Place:    return "place";
        case Stage::Verify:   return "verify";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "] " << config::kDiagnosticModule
        << "/" << stage_name(event.stage);
    if (event.pass != 0) {
        oss << " (pass:" << event.pass << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, Stage stage, const std::string& message) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.stage = stage;
    event.message = message;
    event.pass = pass_;
    events_.push_back(std::move(event));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select(events_, [severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(Stage stage) const {
    return select(events_, [stage](const DiagnosticEvent& e) { return e.stage == stage; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_pass(std::uint64_t pass) const {
    return select(events_, [pass](const DiagnosticEvent& e) { return e.pass == pass; });
}

bool DiagnosticEmitter::has_events_at_or_above(Severity severity) const {
    for (const auto& e : events_) {
        if (e.severity >= severity) return true;
    }
    return false;
}

}  // namespace flexgrid::core
