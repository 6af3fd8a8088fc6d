#include "slotplanner/app/CliRunner.hpp"

#include <QObject>
#include <QSettings>
#include <QTextStream>

#include "slotplanner/app/AppContext.hpp"
#include "slotplanner/app/ScheduleService.hpp"
#include "slotplanner/core/Logging.hpp"
#include "slotplanner/core/SchedulerSettings.hpp"
#include "slotplanner/core/SlotGrid.hpp"
#include "slotplanner/core/TaskValidator.hpp"
#include "slotplanner/data/ScheduleExporter.hpp"
#include "slotplanner/data/TaskRepository.hpp"
#include "slotplanner/ui/ScheduleTextRenderer.hpp"

namespace slotplanner {
namespace app {

namespace {
QString formatTask(const data::Task &task)
{
    return QStringLiteral("%1  %2  %3 min  %4  %5  %6")
        .arg(task.id.toString(QUuid::WithoutBraces),
             task.title,
             QString::number(task.durationMinutes),
             data::importanceToString(task.importance),
             data::priorityToString(task.priority),
             task.deadline.toString(Qt::ISODate));
}
} // namespace

CliRunner::CliRunner(QSettings &settings, QTextStream &out, QTextStream &err)
    : m_settings(settings)
    , m_out(out)
    , m_err(err)
    , m_storeOption(QStringLiteral("store"), QObject::tr("Task file (iCalendar)."), QStringLiteral("file"))
    , m_titleOption(QStringLiteral("title"), QObject::tr("Task title."), QStringLiteral("text"))
    , m_durationOption(QStringLiteral("duration"), QObject::tr("Duration in minutes."), QStringLiteral("minutes"), QStringLiteral("30"))
    , m_importanceOption(QStringLiteral("importance"),
                         QObject::tr("ASAP, High, Average or Low."),
                         QStringLiteral("level"),
                         QStringLiteral("Average"))
    , m_priorityOption(QStringLiteral("priority"),
                       QObject::tr("ASAP, \"Hard deadline\", \"Soft deadline\" or \"No deadline\"."),
                       QStringLiteral("class"),
                       QStringLiteral("Soft deadline"))
    , m_deadlineOption(QStringLiteral("deadline"), QObject::tr("Deadline (YYYY-MM-DD)."), QStringLiteral("date"))
    , m_dateOption(QStringLiteral("date"), QObject::tr("First day of the schedule (YYYY-MM-DD)."), QStringLiteral("date"))
    , m_startHourOption(QStringLiteral("start-hour"), QObject::tr("First working hour."), QStringLiteral("hour"))
    , m_endHourOption(QStringLiteral("end-hour"), QObject::tr("Hour the working day ends."), QStringLiteral("hour"))
    , m_maxDaysOption(QStringLiteral("max-days"), QObject::tr("Days the scheduler may look ahead."), QStringLiteral("days"))
    , m_exportOption(QStringLiteral("export"), QObject::tr("Write the schedule as JSON."), QStringLiteral("file"))
{
    m_parser.setApplicationDescription(QObject::tr("Allocates tasks to half-hour calendar slots."));
    m_parser.addHelpOption();
    m_parser.addPositionalArgument(QStringLiteral("command"), QObject::tr("add, list, remove, schedule or config."));
    m_parser.addOptions({ m_storeOption,
                          m_titleOption,
                          m_durationOption,
                          m_importanceOption,
                          m_priorityOption,
                          m_deadlineOption,
                          m_dateOption,
                          m_startHourOption,
                          m_endHourOption,
                          m_maxDaysOption,
                          m_exportOption });
}

void CliRunner::setToday(const QDate &today)
{
    m_today = today;
}

int CliRunner::run(const QStringList &arguments)
{
    if (!m_parser.parse(arguments)) {
        return fail(m_parser.errorText());
    }
    if (m_parser.isSet(QStringLiteral("help"))) {
        m_out << m_parser.helpText();
        m_out.flush();
        return 0;
    }

    const QStringList positional = m_parser.positionalArguments();
    if (positional.isEmpty()) {
        return fail(QObject::tr("No command given. Try --help."));
    }
    const QString command = positional.first();
    if (command == QLatin1String("config")) {
        return runConfig();
    }

    const auto options = resolveOptions();
    if (!options) {
        return 1;
    }
    AppContext context(m_parser.value(m_storeOption), *options);
    qCDebug(lcCli) << "Using task store" << context.storePath();

    if (command == QLatin1String("add")) {
        return runAdd(context);
    }
    if (command == QLatin1String("list")) {
        return runList(context);
    }
    if (command == QLatin1String("remove")) {
        return runRemove(context, positional);
    }
    if (command == QLatin1String("schedule")) {
        return runSchedule(context);
    }
    return fail(QObject::tr("Unknown command \"%1\".").arg(command));
}

int CliRunner::runAdd(AppContext &context)
{
    data::Task task;
    task.title = m_parser.value(m_titleOption).trimmed();
    task.deadline = m_today.isValid() ? m_today : QDate::currentDate();

    const auto duration = intOption(m_durationOption);
    if (!duration) {
        return 1;
    }
    task.durationMinutes = *duration;

    const auto importance = data::importanceFromString(m_parser.value(m_importanceOption));
    if (!importance) {
        return fail(QObject::tr("Unknown importance \"%1\".").arg(m_parser.value(m_importanceOption)));
    }
    task.importance = *importance;

    const auto priority = data::priorityFromString(m_parser.value(m_priorityOption));
    if (!priority) {
        return fail(QObject::tr("Unknown priority \"%1\".").arg(m_parser.value(m_priorityOption)));
    }
    task.priority = *priority;

    if (m_parser.isSet(m_deadlineOption)) {
        task.deadline = QDate::fromString(m_parser.value(m_deadlineOption), Qt::ISODate);
    }

    if (const auto error = core::validateTask(task)) {
        return fail(error->message);
    }
    const QString title = task.title;
    const auto stored = context.taskRepository().addTask(std::move(task));
    if (!stored) {
        return fail(QObject::tr("Could not store \"%1\" in %2.").arg(title, context.storePath()));
    }
    m_out << formatTask(*stored) << '\n';
    m_out.flush();
    return 0;
}

int CliRunner::runList(AppContext &context)
{
    for (const auto &task : context.taskRepository().fetchTasks()) {
        m_out << formatTask(task) << '\n';
    }
    m_out.flush();
    return 0;
}

int CliRunner::runRemove(AppContext &context, const QStringList &positional)
{
    if (positional.size() < 2) {
        return fail(QObject::tr("remove needs a task id."));
    }
    const QUuid id(QStringLiteral("{%1}").arg(positional.at(1)));
    if (id.isNull() || !context.taskRepository().findById(id)) {
        return fail(QObject::tr("No task with id \"%1\".").arg(positional.at(1)));
    }
    if (!context.taskRepository().removeTask(id)) {
        return fail(QObject::tr("Could not remove \"%1\" from %2.").arg(positional.at(1), context.storePath()));
    }
    return 0;
}

int CliRunner::runSchedule(AppContext &context)
{
    auto &service = context.scheduleService();
    QDate reference = m_today;
    if (m_parser.isSet(m_dateOption)) {
        reference = QDate::fromString(m_parser.value(m_dateOption), Qt::ISODate);
        if (!reference.isValid()) {
            return fail(QObject::tr("Invalid date \"%1\".").arg(m_parser.value(m_dateOption)));
        }
    }
    service.setReferenceDate(reference);

    if (!service.refresh()) {
        const auto &error = *service.lastError();
        return fail(QStringLiteral("%1: %2").arg(core::errorKindToString(error.kind), error.message));
    }

    const auto grid = core::SlotGrid::create(service.options().startHour, service.options().endHour);
    const ui::ScheduleTextRenderer renderer(*grid);
    m_out << renderer.render(service.schedule());
    m_out.flush();

    if (m_parser.isSet(m_exportOption)) {
        if (!data::ScheduleExporter::writeToFile(service.schedule(), m_parser.value(m_exportOption))) {
            return fail(QObject::tr("Could not write %1.").arg(m_parser.value(m_exportOption)));
        }
    }
    return 0;
}

int CliRunner::runConfig()
{
    const auto options = resolveOptions();
    if (!options) {
        return 1;
    }
    if (const auto error = core::Scheduler::validateOptions(*options)) {
        return fail(error->message);
    }
    core::SchedulerSettings::save(m_settings, *options);
    m_settings.sync();
    m_out << "start-hour=" << options->startHour << '\n';
    m_out << "end-hour=" << options->endHour << '\n';
    m_out << "max-days=" << options->maxLookAheadDays << '\n';
    m_out.flush();
    return 0;
}

std::optional<core::SchedulerOptions> CliRunner::resolveOptions()
{
    core::SchedulerOptions options = core::SchedulerSettings::load(m_settings);
    if (m_parser.isSet(m_startHourOption)) {
        const auto value = intOption(m_startHourOption);
        if (!value) {
            return std::nullopt;
        }
        options.startHour = *value;
    }
    if (m_parser.isSet(m_endHourOption)) {
        const auto value = intOption(m_endHourOption);
        if (!value) {
            return std::nullopt;
        }
        options.endHour = *value;
    }
    if (m_parser.isSet(m_maxDaysOption)) {
        const auto value = intOption(m_maxDaysOption);
        if (!value) {
            return std::nullopt;
        }
        options.maxLookAheadDays = *value;
    }
    return options;
}

std::optional<int> CliRunner::intOption(const QCommandLineOption &option)
{
    bool ok = false;
    const int value = m_parser.value(option).toInt(&ok);
    if (!ok) {
        fail(QObject::tr("--%1 expects a number, got \"%2\".").arg(option.names().first(), m_parser.value(option)));
        return std::nullopt;
    }
    return value;
}

int CliRunner::fail(const QString &message)
{
    qCDebug(lcCli) << "Command failed:" << message;
    m_err << message << '\n';
    m_err.flush();
    return 1;
}

} // namespace app
} // namespace slotplanner
