#include "slotplanner/core/TaskValidator.hpp"

namespace slotplanner {
namespace core {

namespace {
SchedulingError invalid(const data::Task &task, const QString &message)
{
    return SchedulingError{ SchedulingError::Kind::InvalidTask, task.id, message };
}

bool isKnownImportance(data::Importance importance)
{
    switch (importance) {
    case data::Importance::Asap:
    case data::Importance::High:
    case data::Importance::Average:
    case data::Importance::Low:
        return true;
    }
    return false;
}

bool isKnownPriority(data::Priority priority)
{
    switch (priority) {
    case data::Priority::Asap:
    case data::Priority::HardDeadline:
    case data::Priority::SoftDeadline:
    case data::Priority::NoDeadline:
        return true;
    }
    return false;
}
} // namespace

std::optional<SchedulingError> validateTask(const data::Task &task)
{
    if (task.id.isNull()) {
        return invalid(task, QStringLiteral("task has no id"));
    }
    if (task.title.trimmed().isEmpty()) {
        return invalid(task, QStringLiteral("task %1 has an empty title").arg(task.id.toString(QUuid::WithoutBraces)));
    }
    if (task.durationMinutes <= 0) {
        return invalid(task, QStringLiteral("task \"%1\" has a non-positive duration (%2 min)")
                                 .arg(task.title)
                                 .arg(task.durationMinutes));
    }
    if (!task.deadline.isValid()) {
        return invalid(task, QStringLiteral("task \"%1\" has no valid deadline").arg(task.title));
    }
    if (!isKnownImportance(task.importance)) {
        return invalid(task, QStringLiteral("task \"%1\" has an unknown importance").arg(task.title));
    }
    if (!isKnownPriority(task.priority)) {
        return invalid(task, QStringLiteral("task \"%1\" has an unknown priority").arg(task.title));
    }
    return std::nullopt;
}

std::optional<SchedulingError> validateTasks(const std::vector<data::Task> &tasks)
{
    for (const auto &task : tasks) {
        if (auto error = validateTask(task)) {
            return error;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace slotplanner
