#pragma once

#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include "slotplanner/core/Schedule.hpp"

namespace slotplanner {
namespace data {

// Writes a schedule as { "YYYY-MM-DD": { "H:MM": { task } } }.
// JSON object keys come out sorted as text, so "10:00" precedes "9:00";
// readers order slots with core::SlotGrid::indexOf.
class ScheduleExporter
{
public:
    static QJsonObject taskToJson(const Task &task);
    static QJsonDocument toJson(const core::Schedule &schedule);
    static bool writeToFile(const core::Schedule &schedule, const QString &filePath);
};

} // namespace data
} // namespace slotplanner
