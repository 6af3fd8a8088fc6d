#include "slotplanner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcService, "slotplanner.service")
Q_LOGGING_CATEGORY(lcStorage, "slotplanner.storage")
Q_LOGGING_CATEGORY(lcCli, "slotplanner.cli")
