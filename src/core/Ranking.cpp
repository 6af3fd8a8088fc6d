#include "slotplanner/core/Ranking.hpp"

#include <algorithm>

namespace slotplanner {
namespace core {

int priorityRank(data::Priority priority)
{
    switch (priority) {
    case data::Priority::Asap:
        return 0;
    case data::Priority::HardDeadline:
        return 1;
    case data::Priority::SoftDeadline:
        return 2;
    case data::Priority::NoDeadline:
        return 3;
    }
    return 3;
}

int importanceRank(data::Importance importance)
{
    switch (importance) {
    case data::Importance::Asap:
        return 0;
    case data::Importance::High:
        return 1;
    case data::Importance::Average:
        return 2;
    case data::Importance::Low:
        return 3;
    }
    return 3;
}

bool ranksBefore(const data::Task &lhs, const data::Task &rhs)
{
    const int lhsPriority = priorityRank(lhs.priority);
    const int rhsPriority = priorityRank(rhs.priority);
    if (lhsPriority != rhsPriority) {
        return lhsPriority < rhsPriority;
    }
    const int lhsImportance = importanceRank(lhs.importance);
    const int rhsImportance = importanceRank(rhs.importance);
    if (lhsImportance != rhsImportance) {
        return lhsImportance < rhsImportance;
    }
    return lhs.deadline < rhs.deadline;
}

std::vector<data::Task> rankTasks(std::vector<data::Task> tasks)
{
    std::stable_sort(tasks.begin(), tasks.end(), ranksBefore);
    return tasks;
}

} // namespace core
} // namespace slotplanner
