#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace data {

namespace {
// "Hard deadline", "HardDeadline", "hard-deadline" and "hard_deadline" all match.
QString normalizeLabel(const QString &value)
{
    QString normalized;
    normalized.reserve(value.size());
    for (const QChar ch : value.trimmed()) {
        if (ch.isSpace() || ch == '-' || ch == '_') {
            continue;
        }
        normalized.append(ch.toLower());
    }
    return normalized;
}
} // namespace

QString importanceToString(Importance importance)
{
    switch (importance) {
    case Importance::Asap:
        return QStringLiteral("ASAP");
    case Importance::High:
        return QStringLiteral("High");
    case Importance::Low:
        return QStringLiteral("Low");
    case Importance::Average:
    default:
        return QStringLiteral("Average");
    }
}

std::optional<Importance> importanceFromString(const QString &value)
{
    const QString normalized = normalizeLabel(value);
    if (normalized == QLatin1String("asap")) {
        return Importance::Asap;
    }
    if (normalized == QLatin1String("high")) {
        return Importance::High;
    }
    if (normalized == QLatin1String("average")) {
        return Importance::Average;
    }
    if (normalized == QLatin1String("low")) {
        return Importance::Low;
    }
    return std::nullopt;
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::Asap:
        return QStringLiteral("ASAP");
    case Priority::HardDeadline:
        return QStringLiteral("Hard deadline");
    case Priority::NoDeadline:
        return QStringLiteral("No deadline");
    case Priority::SoftDeadline:
    default:
        return QStringLiteral("Soft deadline");
    }
}

std::optional<Priority> priorityFromString(const QString &value)
{
    const QString normalized = normalizeLabel(value);
    if (normalized == QLatin1String("asap")) {
        return Priority::Asap;
    }
    if (normalized == QLatin1String("harddeadline")) {
        return Priority::HardDeadline;
    }
    if (normalized == QLatin1String("softdeadline")) {
        return Priority::SoftDeadline;
    }
    if (normalized == QLatin1String("nodeadline")) {
        return Priority::NoDeadline;
    }
    return std::nullopt;
}

} // namespace data
} // namespace slotplanner
