#pragma once

#include <iosfwd>
#include <string>

namespace gardener::discovery {

/// Receives human-readable progress lines from long-running operations.
/// Implementations report failure by throwing a std::exception; callers log
/// it and carry on.
class ProgressSink {
public:
  virtual ~ProgressSink() = default;
  virtual void on_progress(const std::string &message) = 0;
};

class ConsoleProgressSink final : public ProgressSink {
public:
  explicit ConsoleProgressSink(std::ostream &out);
  void on_progress(const std::string &message) override;

private:
  std::ostream &out_;
};

/// Forwards progress into the global observer as ProgressEvents.
class ObserverProgressSink final : public ProgressSink {
public:
  explicit ObserverProgressSink(std::string component);
  void on_progress(const std::string &message) override;

private:
  std::string component_;
};

/// Calls `sink` (if any) and turns a thrown exception into a logged warning.
void notify_progress(ProgressSink *sink, const std::string &component, const std::string &message);

} // namespace gardener::discovery
