#pragma once

#include <QMetaType>
#include <QString>
#include <QUuid>

namespace slotplanner {
namespace core {

struct SchedulingError
{
    enum class Kind
    {
        InvalidTask,
        UnschedulableTask,
        InvalidConfiguration,
    };

    Kind kind = Kind::InvalidTask;
    QUuid taskId; // null for configuration errors
    QString message;
};

QString errorKindToString(SchedulingError::Kind kind);

} // namespace core
} // namespace slotplanner

Q_DECLARE_METATYPE(slotplanner::core::SchedulingError)
