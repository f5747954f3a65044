#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace easel::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;   // "canvas", "draw_target", "backend"
    std::string stage;    // the operation that reported it
    std::string message;
    std::uint64_t sequence = 0;  // per-emitter, starts at 1
    std::uint64_t frame = 0;     // 0 when no frame was started
};

const char* severity_name(Severity severity);

// "warning draw_target.pop_clip: message (frame 3)"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Structured log sink shared by a backend and every draw target it creates.
// Events below the minimum severity are dropped before observers run. Only
// the newest config::kMaxDiagnosticEvents events are retained.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    // Tags later events with `frame` until the next call.
    void begin_frame(std::uint64_t frame) { frame_ = frame; }
    std::uint64_t frame() const { return frame_; }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::deque<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    // Counts every emitted event at `severity`, including evicted ones.
    std::size_t count(Severity severity) const;

    void clear();
    std::size_t size() const { return events_.size(); }

private:
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred&& pred) const;

    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t next_sequence_ = 1;
    std::uint64_t frame_ = 0;
    std::size_t counts_[3] = {0, 0, 0};
    Severity min_severity_ = Severity::Info;
};

// A drawing call that failed, with the events that led up to it.
struct FailureTrace {
    std::uint64_t frame = 0;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;

    std::string format() const;
};

class FailureTraceCollector {
public:
    // Keeps the last config::kFailureContextEvents events of `emitter` as
    // context. Only the newest config::kMaxFailureTraces traces are kept.
    FailureTrace capture(const DiagnosticEmitter& emitter,
                         const std::string& module,
                         const std::string& stage,
                         const std::string& error_message);

    const std::deque<FailureTrace>& traces() const { return traces_; }
    void clear() { traces_.clear(); }
    std::size_t size() const { return traces_.size(); }

private:
    std::deque<FailureTrace> traces_;
};

} // namespace easel::core
