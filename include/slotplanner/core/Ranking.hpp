#pragma once

#include <vector>

#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace core {

int priorityRank(data::Priority priority);
int importanceRank(data::Importance importance);

// Lexicographic over (priority rank, importance rank, deadline).
bool ranksBefore(const data::Task &lhs, const data::Task &rhs);

// Stable: tasks equal on all three keys keep their input order, so the
// result is independent of input order only when the keys are distinct.
std::vector<data::Task> rankTasks(std::vector<data::Task> tasks);

} // namespace core
} // namespace slotplanner
