#pragma once

#include "slotplanner/core/Scheduler.hpp"

class QSettings;

namespace slotplanner {
namespace core {

class SchedulerSettings
{
public:
    // Missing keys fall back to the SchedulerOptions defaults.
    static SchedulerOptions load(const QSettings &settings);
    static void save(QSettings &settings, const SchedulerOptions &options);
};

} // namespace core
} // namespace slotplanner
