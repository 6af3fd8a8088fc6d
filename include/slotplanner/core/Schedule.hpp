#pragma once

#include <QDate>
#include <QHash>
#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <optional>

#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace core {

// Date -> slot label -> task. A task spanning N slots is stored under each
// of its N slot labels.
class Schedule
{
public:
    using DaySlots = QHash<QString, data::Task>;

    bool isEmpty() const;
    int dayCount() const;
    int occupiedSlotCount() const;

    QList<QDate> dates() const;
    DaySlots day(const QDate &date) const;
    const QMap<QDate, DaySlots> &days() const;

    bool isOccupied(const QDate &date, const QString &slot) const;
    std::optional<data::Task> taskAt(const QDate &date, const QString &slot) const;

    // Fails if the slot is already taken; slots are never reassigned.
    bool assign(const QDate &date, const QString &slot, const data::Task &task);

    static QString dateKey(const QDate &date);

private:
    QMap<QDate, DaySlots> m_days;
};

} // namespace core
} // namespace slotplanner

Q_DECLARE_METATYPE(slotplanner::core::Schedule)
