#pragma once

#include "gardener/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gardener::projects {

/// Adapter training lifecycle. Moves forward only; Completed and Failed are
/// terminal.
enum class TrainingStatus { Pending, Training, Completed, Failed };

[[nodiscard]] std::string_view training_status_name(TrainingStatus status);
[[nodiscard]] std::optional<TrainingStatus> parse_training_status(std::string_view text);
[[nodiscard]] bool is_terminal(TrainingStatus status);

/// Same-state updates count as valid no-ops.
[[nodiscard]] bool is_valid_transition(TrainingStatus from, TrainingStatus to);

struct ProjectRecord {
  std::string id;
  std::string name;
  std::filesystem::path source_path;
  std::string created_at;
  TrainingStatus training_status = TrainingStatus::Pending;
  std::string updated_at;
  std::optional<std::string> language;
  std::size_t file_count = 0;
};

/// Non-empty after trimming and free of `<>:"/\|?*`.
[[nodiscard]] common::Status validate_project_name(const std::string &name);

} // namespace gardener::projects
