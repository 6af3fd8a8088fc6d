#pragma once

#include <QDate>
#include <optional>
#include <vector>

#include "slotplanner/core/Schedule.hpp"
#include "slotplanner/core/SchedulingError.hpp"
#include "slotplanner/core/SlotGrid.hpp"
#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace core {

struct SchedulerOptions
{
    int startHour = SlotGrid::DefaultStartHour;
    int endHour = SlotGrid::DefaultEndHour;
    // Days available for placement, counting the reference date itself.
    int maxLookAheadDays = 365;
};

// Running state threaded through placement. Only ever moves forward.
struct PlacementCursor
{
    QDate date;
    int slotIndex = 0;
};

class ScheduleResult
{
public:
    static ScheduleResult success(Schedule schedule);
    static ScheduleResult failure(SchedulingError error);

    bool ok() const;
    const Schedule &schedule() const;
    const std::optional<SchedulingError> &error() const;

private:
    Schedule m_schedule;
    std::optional<SchedulingError> m_error;
};

class Scheduler
{
public:
    explicit Scheduler(SchedulerOptions options = {});

    const SchedulerOptions &options() const;

    // Ranks the tasks and places each one in the earliest contiguous run of
    // free slots at or after the cursor, spilling to following days. Either
    // every task is placed or the call fails.
    ScheduleResult schedule(const std::vector<data::Task> &tasks, const QDate &referenceDate) const;

    static int slotsNeeded(int durationMinutes);
    static std::optional<SchedulingError> validateOptions(const SchedulerOptions &options);

private:
    SchedulerOptions m_options;
};

// Index of the last slot of the first run of `slotsNeeded` free slots on
// cursor.date, scanning from cursor.slotIndex. An occupied slot restarts the run.
std::optional<int> findFreeRun(const Schedule &schedule,
                               const SlotGrid &grid,
                               const PlacementCursor &cursor,
                               int slotsNeeded);

} // namespace core
} // namespace slotplanner
