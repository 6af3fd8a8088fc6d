#include "slotplanner/core/SchedulerSettings.hpp"

#include <QSettings>

namespace slotplanner {
namespace core {

namespace {
const QString StartHourKey = QStringLiteral("schedule/startHour");
const QString EndHourKey = QStringLiteral("schedule/endHour");
const QString MaxLookAheadKey = QStringLiteral("schedule/maxLookAheadDays");
} // namespace

SchedulerOptions SchedulerSettings::load(const QSettings &settings)
{
    SchedulerOptions options;
    options.startHour = settings.value(StartHourKey, options.startHour).toInt();
    options.endHour = settings.value(EndHourKey, options.endHour).toInt();
    options.maxLookAheadDays = settings.value(MaxLookAheadKey, options.maxLookAheadDays).toInt();
    return options;
}

void SchedulerSettings::save(QSettings &settings, const SchedulerOptions &options)
{
    settings.setValue(StartHourKey, options.startHour);
    settings.setValue(EndHourKey, options.endHour);
    settings.setValue(MaxLookAheadKey, options.maxLookAheadDays);
}

} // namespace core
} // namespace slotplanner
