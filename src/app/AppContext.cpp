#include "slotplanner/app/AppContext.hpp"

#include "slotplanner/app/ScheduleService.hpp"
#include "slotplanner/data/DataProvider.hpp"

namespace slotplanner {
namespace app {

AppContext::AppContext(const QString &storePath, const core::SchedulerOptions &options)
    : m_dataProvider(std::make_unique<data::DataProvider>(storePath))
    , m_scheduleService(std::make_unique<ScheduleService>(m_dataProvider->taskRepository(), options))
{
}

AppContext::~AppContext() = default;

data::TaskRepository &AppContext::taskRepository()
{
    return m_dataProvider->taskRepository();
}

ScheduleService &AppContext::scheduleService()
{
    return *m_scheduleService;
}

QString AppContext::storePath() const
{
    return m_dataProvider->storePath();
}

} // namespace app
} // namespace slotplanner
