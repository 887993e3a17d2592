#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cursorhist::observability {

struct IndexStartEvent {
  std::string projects_dir;
};

struct ProjectResolvedEvent {
  std::string folder;
  std::string workspace;
};

struct TranscriptScannedEvent {
  std::string path;
  std::uint64_t messages = 0;
  std::uint64_t tool_calls = 0;
};

struct IndexEndEvent {
  std::uint64_t sessions = 0;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<IndexStartEvent, ProjectResolvedEvent, TranscriptScannedEvent,
                                   IndexEndEvent, ErrorEvent>;

struct SessionsIndexedMetric {
  std::uint64_t count = 0;
};

struct TokensEstimatedMetric {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

using ObserverMetric = std::variant<SessionsIndexedMetric, TokensEstimatedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cursorhist::observability
