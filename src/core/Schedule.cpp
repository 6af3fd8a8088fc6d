#include "slotplanner/core/Schedule.hpp"

namespace slotplanner {
namespace core {

bool Schedule::isEmpty() const
{
    return m_days.isEmpty();
}

int Schedule::dayCount() const
{
    return m_days.size();
}

int Schedule::occupiedSlotCount() const
{
    int count = 0;
    for (const auto &daySlots : m_days) {
        count += daySlots.size();
    }
    return count;
}

QList<QDate> Schedule::dates() const
{
    return m_days.keys();
}

Schedule::DaySlots Schedule::day(const QDate &date) const
{
    return m_days.value(date);
}

const QMap<QDate, Schedule::DaySlots> &Schedule::days() const
{
    return m_days;
}

bool Schedule::isOccupied(const QDate &date, const QString &slot) const
{
    const auto it = m_days.constFind(date);
    return it != m_days.constEnd() && it->contains(slot);
}

std::optional<data::Task> Schedule::taskAt(const QDate &date, const QString &slot) const
{
    const auto it = m_days.constFind(date);
    if (it == m_days.constEnd() || !it->contains(slot)) {
        return std::nullopt;
    }
    return it->value(slot);
}

bool Schedule::assign(const QDate &date, const QString &slot, const data::Task &task)
{
    if (!date.isValid() || slot.isEmpty()) {
        return false;
    }
    auto &daySlots = m_days[date];
    if (daySlots.contains(slot)) {
        return false;
    }
    daySlots.insert(slot, task);
    return true;
}

QString Schedule::dateKey(const QDate &date)
{
    return date.toString(Qt::ISODate);
}

} // namespace core
} // namespace slotplanner
