#include "slotplanner/core/Scheduler.hpp"

#include "slotplanner/core/Ranking.hpp"
#include "slotplanner/core/TaskValidator.hpp"

#include <algorithm>

namespace slotplanner {
namespace core {

namespace {
struct PlacementState
{
    Schedule schedule;
    PlacementCursor cursor;
    std::optional<SchedulingError> error;
};

SchedulingError unschedulable(const data::Task &task, const QString &message)
{
    return SchedulingError{ SchedulingError::Kind::UnschedulableTask, task.id, message };
}

PlacementState placeTask(PlacementState state, const data::Task &task, const SlotGrid &grid, const QDate &lastDay)
{
    const int needed = Scheduler::slotsNeeded(task.durationMinutes);
    if (needed > grid.size()) {
        state.error = unschedulable(task, QStringLiteral("task \"%1\" needs %2 slots but a day has only %3")
                                              .arg(task.title)
                                              .arg(needed)
                                              .arg(grid.size()));
        return state;
    }

    while (state.cursor.date <= lastDay) {
        const auto end = findFreeRun(state.schedule, grid, state.cursor, needed);
        if (end) {
            for (int index = *end - needed + 1; index <= *end; ++index) {
                state.schedule.assign(state.cursor.date, grid.label(index), task);
            }
            state.cursor.slotIndex = *end + 1;
            return state;
        }
        state.cursor.date = state.cursor.date.addDays(1);
        state.cursor.slotIndex = 0;
    }

    state.error = unschedulable(task, QStringLiteral("task \"%1\" does not fit before %2")
                                          .arg(task.title, Schedule::dateKey(lastDay.addDays(1))));
    return state;
}
} // namespace

ScheduleResult ScheduleResult::success(Schedule schedule)
{
    ScheduleResult result;
    result.m_schedule = std::move(schedule);
    return result;
}

ScheduleResult ScheduleResult::failure(SchedulingError error)
{
    ScheduleResult result;
    result.m_error = std::move(error);
    return result;
}

bool ScheduleResult::ok() const
{
    return !m_error.has_value();
}

const Schedule &ScheduleResult::schedule() const
{
    return m_schedule;
}

const std::optional<SchedulingError> &ScheduleResult::error() const
{
    return m_error;
}

Scheduler::Scheduler(SchedulerOptions options)
    : m_options(options)
{
}

const SchedulerOptions &Scheduler::options() const
{
    return m_options;
}

ScheduleResult Scheduler::schedule(const std::vector<data::Task> &tasks, const QDate &referenceDate) const
{
    if (auto error = validateOptions(m_options)) {
        return ScheduleResult::failure(*error);
    }
    if (!referenceDate.isValid()) {
        return ScheduleResult::failure(
            { SchedulingError::Kind::InvalidConfiguration, {}, QStringLiteral("reference date is invalid") });
    }
    if (auto error = validateTasks(tasks)) {
        return ScheduleResult::failure(*error);
    }

    const auto grid = SlotGrid::create(m_options.startHour, m_options.endHour);
    const QDate lastDay = referenceDate.addDays(m_options.maxLookAheadDays - 1);

    PlacementState state;
    state.cursor = PlacementCursor{ referenceDate, 0 };
    for (const auto &task : rankTasks(tasks)) {
        state = placeTask(std::move(state), task, *grid, lastDay);
        if (state.error) {
            return ScheduleResult::failure(*state.error);
        }
    }
    return ScheduleResult::success(std::move(state.schedule));
}

int Scheduler::slotsNeeded(int durationMinutes)
{
    if (durationMinutes <= 0) {
        return 0;
    }
    return (durationMinutes + SlotGrid::SlotLengthMinutes - 1) / SlotGrid::SlotLengthMinutes;
}

std::optional<SchedulingError> Scheduler::validateOptions(const SchedulerOptions &options)
{
    if (!SlotGrid::isValidRange(options.startHour, options.endHour)) {
        return SchedulingError{ SchedulingError::Kind::InvalidConfiguration,
                                {},
                                QStringLiteral("invalid working hours %1..%2").arg(options.startHour).arg(options.endHour) };
    }
    if (options.maxLookAheadDays < 1) {
        return SchedulingError{ SchedulingError::Kind::InvalidConfiguration,
                                {},
                                QStringLiteral("look-ahead must be at least one day, got %1").arg(options.maxLookAheadDays) };
    }
    return std::nullopt;
}

std::optional<int> findFreeRun(const Schedule &schedule,
                               const SlotGrid &grid,
                               const PlacementCursor &cursor,
                               int slotsNeeded)
{
    if (slotsNeeded <= 0) {
        return std::nullopt;
    }
    int available = 0;
    for (int index = std::max(cursor.slotIndex, 0); index < grid.size(); ++index) {
        if (schedule.isOccupied(cursor.date, grid.label(index))) {
            available = 0;
            continue;
        }
        if (++available == slotsNeeded) {
            return index;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace slotplanner
