#pragma once

#include <QDate>
#include <QObject>
#include <optional>

#include "slotplanner/core/Schedule.hpp"
#include "slotplanner/core/Scheduler.hpp"
#include "slotplanner/core/SchedulingError.hpp"
#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace data {
class TaskRepository;
}

namespace app {

// Owns the schedule derived from a task repository. Every change to the task
// set recomputes the schedule from scratch.
class ScheduleService : public QObject
{
    Q_OBJECT

public:
    ScheduleService(data::TaskRepository &repository,
                    core::SchedulerOptions options = {},
                    QObject *parent = nullptr);

    // An invalid date means "today" at refresh time.
    void setReferenceDate(const QDate &date);
    QDate referenceDate() const;

    void setOptions(const core::SchedulerOptions &options);
    const core::SchedulerOptions &options() const;

    std::optional<data::Task> addTask(data::Task task);
    bool updateTask(const data::Task &task);
    bool removeTask(const QUuid &id);

    const core::Schedule &schedule() const;
    const std::optional<core::SchedulingError> &lastError() const;

public slots:
    bool refresh();

signals:
    void scheduleChanged(const slotplanner::core::Schedule &schedule);
    void schedulingFailed(const slotplanner::core::SchedulingError &error);

private:
    data::TaskRepository &m_repository;
    core::SchedulerOptions m_options;
    QDate m_referenceDate;
    core::Schedule m_schedule;
    std::optional<core::SchedulingError> m_lastError;
};

} // namespace app
} // namespace slotplanner
