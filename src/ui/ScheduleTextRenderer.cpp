#include "slotplanner/ui/ScheduleTextRenderer.hpp"

#include <QObject>
#include <QTextStream>

namespace slotplanner {
namespace ui {

ScheduleTextRenderer::ScheduleTextRenderer(core::SlotGrid grid)
    : m_grid(std::move(grid))
{
}

QString ScheduleTextRenderer::render(const core::Schedule &schedule) const
{
    if (schedule.isEmpty()) {
        return QObject::tr("No tasks scheduled.\n");
    }
    QString text;
    const auto &days = schedule.days();
    for (auto it = days.constBegin(); it != days.constEnd(); ++it) {
        if (!text.isEmpty()) {
            text += '\n';
        }
        text += renderDay(it.key(), it.value());
    }
    return text;
}

QString ScheduleTextRenderer::renderDay(const QDate &date, const core::Schedule::DaySlots &daySlots) const
{
    QString text;
    QTextStream stream(&text);
    stream << core::Schedule::dateKey(date) << '\n';
    for (const QString &label : m_grid.labels()) {
        const auto it = daySlots.constFind(label);
        if (it == daySlots.constEnd()) {
            continue;
        }
        stream << "  " << label << ": " << it->title << '\n';
    }
    stream.flush();
    return text;
}

} // namespace ui
} // namespace slotplanner
