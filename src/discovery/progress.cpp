#include "gardener/discovery/progress.hpp"

#include "gardener/observability/global.hpp"

#include <exception>
#include <ostream>

namespace gardener::discovery {

ConsoleProgressSink::ConsoleProgressSink(std::ostream &out) : out_(out) {}

void ConsoleProgressSink::on_progress(const std::string &message) {
  out_ << "  " << message << "\n";
  out_.flush();
}

ObserverProgressSink::ObserverProgressSink(std::string component)
    : component_(std::move(component)) {}

void ObserverProgressSink::on_progress(const std::string &message) {
  observability::record_progress(component_, message);
}

void notify_progress(ProgressSink *sink, const std::string &component,
                     const std::string &message) {
  if (sink == nullptr) {
    return;
  }
  try {
    sink->on_progress(message);
  } catch (const std::exception &ex) {
    observability::record_warning(component, std::string("progress sink failed: ") + ex.what());
  } catch (...) {
    observability::record_warning(component, "progress sink failed");
  }
}

} // namespace gardener::discovery
