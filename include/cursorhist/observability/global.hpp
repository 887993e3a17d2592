#pragma once

#include "cursorhist/observability/observer.hpp"

#include <memory>

namespace cursorhist::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_index_start(const std::string &projects_dir);
void record_project_resolved(const std::string &folder, const std::string &workspace);
void record_transcript_scanned(const std::string &path, std::uint64_t messages,
                               std::uint64_t tool_calls);
void record_index_end(std::uint64_t sessions, std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace cursorhist::observability
