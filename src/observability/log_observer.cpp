#include "cursorhist/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace cursorhist::observability {

LogObserver::LogObserver(const bool verbose) : out_(std::cerr), verbose_(verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  if (!verbose_ && level == "DEBUG") {
    return;
  }
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, IndexStartEvent>) {
          log_line("INFO", "index.start projects_dir=" + evt.projects_dir);
        } else if constexpr (std::is_same_v<T, ProjectResolvedEvent>) {
          log_line("DEBUG", "project.resolved folder=" + evt.folder + " workspace=" + evt.workspace);
        } else if constexpr (std::is_same_v<T, TranscriptScannedEvent>) {
          log_line("DEBUG", "transcript.scanned path=" + evt.path +
                                " messages=" + std::to_string(evt.messages) +
                                " tool_calls=" + std::to_string(evt.tool_calls));
        } else if constexpr (std::is_same_v<T, IndexEndEvent>) {
          log_line("INFO", "index.end sessions=" + std::to_string(evt.sessions) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SessionsIndexedMetric>) {
          log_line("DEBUG", "metric.sessions_indexed=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, TokensEstimatedMetric>) {
          log_line("DEBUG", "metric.tokens_estimated input=" + std::to_string(m.input_tokens) +
                                " output=" + std::to_string(m.output_tokens));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace cursorhist::observability
