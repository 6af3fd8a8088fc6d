#pragma once

#include <QString>

#include "slotplanner/core/Schedule.hpp"
#include "slotplanner/core/SlotGrid.hpp"

namespace slotplanner {
namespace ui {

// Plain-text schedule: a date header per day followed by "H:MM: title"
// lines in grid order.
class ScheduleTextRenderer
{
public:
    explicit ScheduleTextRenderer(core::SlotGrid grid);

    QString render(const core::Schedule &schedule) const;
    QString renderDay(const QDate &date, const core::Schedule::DaySlots &daySlots) const;

private:
    core::SlotGrid m_grid;
};

} // namespace ui
} // namespace slotplanner
