#include "slotplanner/core/SlotGrid.hpp"

namespace slotplanner {
namespace core {

SlotGrid::SlotGrid(int startHour, int endHour)
{
    m_labels.reserve((endHour - startHour) * 2);
    for (int hour = startHour; hour < endHour; ++hour) {
        m_labels << QStringLiteral("%1:00").arg(hour);
        m_labels << QStringLiteral("%1:30").arg(hour);
    }
}

std::optional<SlotGrid> SlotGrid::create(int startHour, int endHour)
{
    if (!isValidRange(startHour, endHour)) {
        return std::nullopt;
    }
    return SlotGrid(startHour, endHour);
}

bool SlotGrid::isValidRange(int startHour, int endHour)
{
    return startHour >= 0 && endHour <= 24 && startHour < endHour;
}

int SlotGrid::size() const
{
    return m_labels.size();
}

const QStringList &SlotGrid::labels() const
{
    return m_labels;
}

QString SlotGrid::label(int index) const
{
    if (index < 0 || index >= m_labels.size()) {
        return {};
    }
    return m_labels.at(index);
}

int SlotGrid::indexOf(const QString &label) const
{
    return m_labels.indexOf(label);
}

} // namespace core
} // namespace slotplanner
