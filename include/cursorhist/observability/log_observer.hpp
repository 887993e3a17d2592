#pragma once

#include "cursorhist/observability/observer.hpp"

#include <iosfwd>

namespace cursorhist::observability {

/// Writes "[LEVEL] message" lines, to stderr unless another stream is given.
/// DEBUG lines are dropped unless `verbose` is set.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false);
  explicit LogObserver(std::ostream &out, bool verbose = false);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(const std::string &level, const std::string &message);

  std::ostream &out_;
  bool verbose_;
};

} // namespace cursorhist::observability
