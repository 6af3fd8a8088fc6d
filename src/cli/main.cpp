#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "slotplanner/app/CliRunner.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Slot Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("slotplanner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kSlotPlannerVersion));

    QCoreApplication app(argc, argv);

    QSettings settings;
    QTextStream out(stdout);
    QTextStream err(stderr);

    slotplanner::app::CliRunner runner(settings, out, err);
    return runner.run(app.arguments());
}
