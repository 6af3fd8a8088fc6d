#pragma once

#include <optional>
#include <vector>

#include "slotplanner/core/SchedulingError.hpp"
#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace core {

// Returns an InvalidTask error for the first rule the task breaks.
std::optional<SchedulingError> validateTask(const data::Task &task);
std::optional<SchedulingError> validateTasks(const std::vector<data::Task> &tasks);

} // namespace core
} // namespace slotplanner
