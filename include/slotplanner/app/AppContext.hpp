#pragma once

#include <QString>
#include <memory>

#include "slotplanner/core/Scheduler.hpp"

namespace slotplanner {
namespace data {
class DataProvider;
class TaskRepository;
}

namespace app {

class ScheduleService;

class AppContext
{
public:
    AppContext(const QString &storePath, const core::SchedulerOptions &options);
    ~AppContext();

    data::TaskRepository &taskRepository();
    ScheduleService &scheduleService();
    QString storePath() const;

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<ScheduleService> m_scheduleService;
};

} // namespace app
} // namespace slotplanner
