#pragma once

#include <QCommandLineParser>
#include <QDate>
#include <QStringList>
#include <optional>

#include "slotplanner/core/Scheduler.hpp"

class QSettings;
class QTextStream;

namespace slotplanner {
namespace app {

class AppContext;

// Command line front end: add, list, remove, schedule and config.
class CliRunner
{
public:
    CliRunner(QSettings &settings, QTextStream &out, QTextStream &err);

    // Overrides "today" for the schedule command.
    void setToday(const QDate &today);

    // Returns the process exit code.
    int run(const QStringList &arguments);

private:
    int runAdd(AppContext &context);
    int runList(AppContext &context);
    int runRemove(AppContext &context, const QStringList &positional);
    int runSchedule(AppContext &context);
    int runConfig();

    std::optional<core::SchedulerOptions> resolveOptions();
    std::optional<int> intOption(const QCommandLineOption &option);
    int fail(const QString &message);

    QSettings &m_settings;
    QTextStream &m_out;
    QTextStream &m_err;
    QDate m_today;

    QCommandLineParser m_parser;
    QCommandLineOption m_storeOption;
    QCommandLineOption m_titleOption;
    QCommandLineOption m_durationOption;
    QCommandLineOption m_importanceOption;
    QCommandLineOption m_priorityOption;
    QCommandLineOption m_deadlineOption;
    QCommandLineOption m_dateOption;
    QCommandLineOption m_startHourOption;
    QCommandLineOption m_endHourOption;
    QCommandLineOption m_maxDaysOption;
    QCommandLineOption m_exportOption;
};

} // namespace app
} // namespace slotplanner
