#include "slotplanner/app/ScheduleService.hpp"

#include "slotplanner/core/Logging.hpp"
#include "slotplanner/core/TaskValidator.hpp"
#include "slotplanner/data/TaskRepository.hpp"

namespace slotplanner {
namespace app {

ScheduleService::ScheduleService(data::TaskRepository &repository,
                                 core::SchedulerOptions options,
                                 QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_options(options)
{
}

void ScheduleService::setReferenceDate(const QDate &date)
{
    m_referenceDate = date;
}

QDate ScheduleService::referenceDate() const
{
    return m_referenceDate.isValid() ? m_referenceDate : QDate::currentDate();
}

void ScheduleService::setOptions(const core::SchedulerOptions &options)
{
    m_options = options;
}

const core::SchedulerOptions &ScheduleService::options() const
{
    return m_options;
}

std::optional<data::Task> ScheduleService::addTask(data::Task task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    if (const auto error = core::validateTask(task)) {
        qCWarning(lcService) << "Rejected task:" << error->message;
        m_lastError = error;
        emit schedulingFailed(*error);
        return std::nullopt;
    }
    const QString title = task.title;
    const auto stored = m_repository.addTask(std::move(task));
    if (!stored) {
        qCWarning(lcService) << "Task store rejected" << title;
        return std::nullopt;
    }
    refresh();
    return stored;
}

bool ScheduleService::updateTask(const data::Task &task)
{
    if (const auto error = core::validateTask(task)) {
        qCWarning(lcService) << "Rejected task update:" << error->message;
        m_lastError = error;
        emit schedulingFailed(*error);
        return false;
    }
    if (!m_repository.updateTask(task)) {
        return false;
    }
    refresh();
    return true;
}

bool ScheduleService::removeTask(const QUuid &id)
{
    if (!m_repository.removeTask(id)) {
        return false;
    }
    refresh();
    return true;
}

const core::Schedule &ScheduleService::schedule() const
{
    return m_schedule;
}

const std::optional<core::SchedulingError> &ScheduleService::lastError() const
{
    return m_lastError;
}

bool ScheduleService::refresh()
{
    const auto tasks = m_repository.fetchTasks();
    const QDate reference = referenceDate();
    const core::Scheduler scheduler(m_options);
    auto result = scheduler.schedule(tasks, reference);
    if (!result.ok()) {
        m_schedule = core::Schedule{};
        m_lastError = result.error();
        qCWarning(lcService) << core::errorKindToString(m_lastError->kind) << m_lastError->message;
        emit schedulingFailed(*m_lastError);
        return false;
    }

    m_schedule = result.schedule();
    m_lastError.reset();
    qCDebug(lcService) << "Scheduled" << tasks.size() << "tasks over" << m_schedule.dayCount() << "days from"
                       << reference;
    emit scheduleChanged(m_schedule);
    return true;
}

} // namespace app
} // namespace slotplanner
