#pragma once

#include <QDate>
#include <QString>
#include <QUuid>
#include <optional>

namespace slotplanner {
namespace data {

enum class Importance
{
    Asap,
    High,
    Average,
    Low,
};

// Shares the ASAP label with Importance but ranks independently.
enum class Priority
{
    Asap,
    HardDeadline,
    SoftDeadline,
    NoDeadline,
};

struct Task
{
    QUuid id = QUuid::createUuid();
    QString title;
    int durationMinutes = 30;
    Importance importance = Importance::Average;
    Priority priority = Priority::SoftDeadline;
    QDate deadline = QDate::currentDate();
};

QString importanceToString(Importance importance);
std::optional<Importance> importanceFromString(const QString &value);

QString priorityToString(Priority priority);
std::optional<Priority> priorityFromString(const QString &value);

} // namespace data
} // namespace slotplanner
