#include "slotplanner/core/SchedulingError.hpp"

namespace slotplanner {
namespace core {

QString errorKindToString(SchedulingError::Kind kind)
{
    switch (kind) {
    case SchedulingError::Kind::UnschedulableTask:
        return QStringLiteral("UnschedulableTask");
    case SchedulingError::Kind::InvalidConfiguration:
        return QStringLiteral("InvalidConfiguration");
    case SchedulingError::Kind::InvalidTask:
    default:
        return QStringLiteral("InvalidTask");
    }
}

} // namespace core
} // namespace slotplanner
