#include "slotplanner/data/ScheduleExporter.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

#include "slotplanner/core/Logging.hpp"

namespace slotplanner {
namespace data {

QJsonObject ScheduleExporter::taskToJson(const Task &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), task.id.toString(QUuid::WithoutBraces));
    object.insert(QStringLiteral("title"), task.title);
    object.insert(QStringLiteral("duration"), task.durationMinutes);
    object.insert(QStringLiteral("importance"), importanceToString(task.importance));
    object.insert(QStringLiteral("priority"), priorityToString(task.priority));
    object.insert(QStringLiteral("deadline"), task.deadline.toString(Qt::ISODate));
    return object;
}

QJsonDocument ScheduleExporter::toJson(const core::Schedule &schedule)
{
    QJsonObject root;
    const auto &days = schedule.days();
    for (auto dayIt = days.constBegin(); dayIt != days.constEnd(); ++dayIt) {
        QJsonObject daySlots;
        for (auto slotIt = dayIt->constBegin(); slotIt != dayIt->constEnd(); ++slotIt) {
            daySlots.insert(slotIt.key(), taskToJson(slotIt.value()));
        }
        root.insert(core::Schedule::dateKey(dayIt.key()), daySlots);
    }
    return QJsonDocument(root);
}

bool ScheduleExporter::writeToFile(const core::Schedule &schedule, const QString &filePath)
{
    if (filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcStorage) << "Cannot write schedule" << filePath << file.errorString();
        return false;
    }
    file.write(toJson(schedule).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcStorage) << "Failed to commit schedule" << filePath << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace slotplanner
