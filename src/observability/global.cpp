#include "cursorhist/observability/global.hpp"

#include <mutex>

namespace cursorhist::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_index_start(const std::string &projects_dir) {
  record_event(IndexStartEvent{.projects_dir = projects_dir});
}

void record_project_resolved(const std::string &folder, const std::string &workspace) {
  record_event(ProjectResolvedEvent{.folder = folder, .workspace = workspace});
}

void record_transcript_scanned(const std::string &path, const std::uint64_t messages,
                               const std::uint64_t tool_calls) {
  record_event(
      TranscriptScannedEvent{.path = path, .messages = messages, .tool_calls = tool_calls});
}

void record_index_end(const std::uint64_t sessions, const std::chrono::milliseconds duration) {
  record_event(IndexEndEvent{.sessions = sessions, .duration = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace cursorhist::observability
