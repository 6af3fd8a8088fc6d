#include <QtTest/QtTest>

#include "slotplanner/app/ScheduleService.hpp"
#include "slotplanner/data/FileTaskRepository.hpp"
#include "slotplanner/data/InMemoryTaskRepository.hpp"

using namespace slotplanner;

namespace {
const QDate Today(2024, 4, 1);

data::Task makeTask(const QString &title, int duration, data::Priority priority = data::Priority::SoftDeadline)
{
    data::Task task;
    task.title = title;
    task.durationMinutes = duration;
    task.priority = priority;
    task.deadline = Today;
    return task;
}
} // namespace

class ScheduleServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void recomputesOnEveryChange();
    void rejectsInvalidTask();
    void rejectsTaskTheStoreCannotKeep();
    void reportsUnschedulableTask();
    void refreshUsesRepositorySnapshot();
};

void ScheduleServiceTest::initTestCase()
{
    qRegisterMetaType<core::Schedule>();
    qRegisterMetaType<core::SchedulingError>();
}

void ScheduleServiceTest::recomputesOnEveryChange()
{
    data::InMemoryTaskRepository repo;
    app::ScheduleService service(repo);
    service.setReferenceDate(Today);
    QSignalSpy changed(&service, &app::ScheduleService::scheduleChanged);

    const auto soft = service.addTask(makeTask("soft", 30));
    QVERIFY(soft.has_value());
    QCOMPARE(changed.count(), 1);
    QCOMPARE(service.schedule().taskAt(Today, "9:00")->title, QStringLiteral("soft"));

    const auto urgent = service.addTask(makeTask("urgent", 60, data::Priority::Asap));
    QVERIFY(urgent.has_value());
    QCOMPARE(changed.count(), 2);
    QCOMPARE(service.schedule().taskAt(Today, "9:00")->title, QStringLiteral("urgent"));
    QCOMPARE(service.schedule().taskAt(Today, "10:00")->title, QStringLiteral("soft"));

    auto renamed = *soft;
    renamed.title = "renamed";
    QVERIFY(service.updateTask(renamed));
    QCOMPARE(service.schedule().taskAt(Today, "10:00")->title, QStringLiteral("renamed"));

    QVERIFY(service.removeTask(urgent->id));
    QCOMPARE(changed.count(), 4);
    QCOMPARE(service.schedule().taskAt(Today, "9:00")->title, QStringLiteral("renamed"));
    QCOMPARE(service.schedule().occupiedSlotCount(), 1);

    QVERIFY(!service.removeTask(urgent->id));
    QCOMPARE(changed.count(), 4);
}

void ScheduleServiceTest::rejectsInvalidTask()
{
    data::InMemoryTaskRepository repo;
    app::ScheduleService service(repo);
    service.setReferenceDate(Today);
    QSignalSpy failed(&service, &app::ScheduleService::schedulingFailed);

    QVERIFY(!service.addTask(makeTask(QString(), 30)).has_value());
    QCOMPARE(failed.count(), 1);
    QVERIFY(repo.fetchTasks().empty());
    QVERIFY(service.lastError().has_value());
    QCOMPARE(service.lastError()->kind, core::SchedulingError::Kind::InvalidTask);

    const auto error = failed.first().first().value<core::SchedulingError>();
    QCOMPARE(error.kind, core::SchedulingError::Kind::InvalidTask);
}

void ScheduleServiceTest::rejectsTaskTheStoreCannotKeep()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QFile blocker(dir.filePath("file.txt"));
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    data::FileTaskRepository repo(std::make_shared<data::FileTaskStorage>(dir.filePath("file.txt/tasks.ics")));
    app::ScheduleService service(repo);
    service.setReferenceDate(Today);
    QSignalSpy changed(&service, &app::ScheduleService::scheduleChanged);

    QVERIFY(!service.addTask(makeTask("unsaved", 30)).has_value());
    QCOMPARE(changed.count(), 0);
    QVERIFY(repo.fetchTasks().empty());
    QVERIFY(service.schedule().isEmpty());
}

void ScheduleServiceTest::reportsUnschedulableTask()
{
    data::InMemoryTaskRepository repo;
    app::ScheduleService service(repo);
    service.setReferenceDate(Today);
    QVERIFY(service.addTask(makeTask("small", 30)).has_value());
    QVERIFY(!service.schedule().isEmpty());

    QSignalSpy failed(&service, &app::ScheduleService::schedulingFailed);
    const auto huge = service.addTask(makeTask("huge", 600));
    QVERIFY(huge.has_value());
    QCOMPARE(failed.count(), 1);
    QVERIFY(service.schedule().isEmpty());
    QCOMPARE(service.lastError()->kind, core::SchedulingError::Kind::UnschedulableTask);
    QCOMPARE(service.lastError()->taskId, huge->id);

    QVERIFY(service.removeTask(huge->id));
    QVERIFY(!service.lastError().has_value());
    QVERIFY(!service.schedule().isEmpty());
}

void ScheduleServiceTest::refreshUsesRepositorySnapshot()
{
    data::InMemoryTaskRepository repo;
    QVERIFY(repo.addTask(makeTask("first", 30)).has_value());
    QVERIFY(repo.addTask(makeTask("second", 30)).has_value());

    core::SchedulerOptions options;
    options.startHour = 12;
    options.endHour = 13;
    app::ScheduleService service(repo, options);
    service.setReferenceDate(Today);
    QVERIFY(service.schedule().isEmpty());

    QVERIFY(service.refresh());
    QCOMPARE(service.schedule().taskAt(Today, "12:00")->title, QStringLiteral("first"));
    QCOMPARE(service.schedule().taskAt(Today, "12:30")->title, QStringLiteral("second"));

    options.endHour = 12;
    service.setOptions(options);
    QVERIFY(!service.refresh());
    QCOMPARE(service.lastError()->kind, core::SchedulingError::Kind::InvalidConfiguration);
}

QTEST_GUILESS_MAIN(ScheduleServiceTest)
#include "ScheduleServiceTest.moc"
