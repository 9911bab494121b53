#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace flexgrid::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// Step of a layout pass that raised an event.
enum class Stage {
    Config,
    Measure,
    Allocate,
    Place,
    Verify,
};

const char* severity_name(Severity severity);
const char* stage_name(Stage stage);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    Stage stage = Stage::Config;
    std::string message;
    // 0 outside of a pass.
    std::uint64_t pass = 0;
};

// "[warning] grid/allocate (pass:3): ..."
std::string format_diagnostic(const DiagnosticEvent& event);

// Collects the events of the passes it is attached to. Not thread-safe; a
// grid and its emitter live on the layout thread.
class DiagnosticEmitter {
public:
    void emit(Severity severity, Stage stage, const std::string& message);

    // Tags every following event until the next call.
    void begin_pass(std::uint64_t pass) { pass_ = pass; }
    std::uint64_t pass() const { return pass_; }

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(Stage stage) const;
    std::vector<DiagnosticEvent> events_for_pass(std::uint64_t pass) const;
    bool has_events_at_or_above(Severity severity) const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::uint64_t pass_ = 0;
};

}  // namespace flexgrid::core
