#include "gardener/projects/project.hpp"

#include "gardener/common/fs.hpp"

namespace gardener::projects {

namespace {

int rank(const TrainingStatus status) {
  switch (status) {
  case TrainingStatus::Pending:
    return 0;
  case TrainingStatus::Training:
    return 1;
  case TrainingStatus::Completed:
  case TrainingStatus::Failed:
    return 2;
  }
  return 0;
}

} // namespace

std::string_view training_status_name(const TrainingStatus status) {
  switch (status) {
  case TrainingStatus::Pending:
    return "pending";
  case TrainingStatus::Training:
    return "training";
  case TrainingStatus::Completed:
    return "completed";
  case TrainingStatus::Failed:
    return "failed";
  }
  return "pending";
}

std::optional<TrainingStatus> parse_training_status(const std::string_view text) {
  const std::string normalized = common::to_lower(common::trim(std::string(text)));
  if (normalized == "pending") {
    return TrainingStatus::Pending;
  }
  if (normalized == "training") {
    return TrainingStatus::Training;
  }
  if (normalized == "completed") {
    return TrainingStatus::Completed;
  }
  if (normalized == "failed") {
    return TrainingStatus::Failed;
  }
  return std::nullopt;
}

bool is_terminal(const TrainingStatus status) { return rank(status) == 2; }

bool is_valid_transition(const TrainingStatus from, const TrainingStatus to) {
  if (from == to) {
    return true;
  }
  if (is_terminal(from)) {
    return false;
  }
  return rank(to) > rank(from);
}

common::Status validate_project_name(const std::string &name) {
  if (common::trim(name).empty()) {
    return common::Status::error("project name cannot be empty",
                                 common::ErrorCode::InvalidArgument);
  }
  const std::string invalid = "<>:\"/\\|?*";
  if (const auto pos = name.find_first_of(invalid); pos != std::string::npos) {
    return common::Status::error(std::string("project name contains invalid character '") +
                                     name[pos] + "'",
                                 common::ErrorCode::InvalidArgument);
  }
  return common::Status::success();
}

} // namespace gardener::projects
