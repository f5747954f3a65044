#include <easel/core/diagnostics.h>
#include <easel/core/config.h>
#include <algorithm>
#include <iterator>
#include <sstream>

namespace easel::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << severity_name(event.severity) << " " << event.module;
    if (!event.stage.empty()) {
        oss << "." << event.stage;
    }
    oss << ": " << event.message;
    if (event.frame != 0) {
        oss << " (frame " << event.frame << ")";
    }
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) return;

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.sequence = next_sequence_++;
    event.frame = frame_;

    counts_[static_cast<int>(severity)]++;
    events_.push_back(std::move(event));
    if (events_.size() > config::kMaxDiagnosticEvents) {
        events_.pop_front();
    }

    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred&& pred) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), pred);
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return counts_[static_cast<int>(severity)];
}

void DiagnosticEmitter::clear() {
    events_.clear();
    std::fill(std::begin(counts_), std::end(counts_), 0);
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "failed " << module << "." << stage << ": " << error_message;
    if (frame != 0) {
        oss << " (frame " << frame << ")";
    }
    oss << "\n";
    for (const auto& e : context_events) {
        oss << "  after #" << e.sequence << " " << format_diagnostic(e) << "\n";
    }
    return oss.str();
}

FailureTrace FailureTraceCollector::capture(const DiagnosticEmitter& emitter,
                                            const std::string& module,
                                            const std::string& stage,
                                            const std::string& error_message) {
    const auto& events = emitter.events();
    std::size_t keep = std::min(events.size(), config::kFailureContextEvents);

    FailureTrace trace;
    trace.frame = emitter.frame();
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    trace.context_events.assign(events.end() - static_cast<std::ptrdiff_t>(keep), events.end());
    traces_.push_back(trace);
    while (traces_.size() > config::kMaxFailureTraces) traces_.pop_front();
    return trace;
}

} // namespace easel::core
