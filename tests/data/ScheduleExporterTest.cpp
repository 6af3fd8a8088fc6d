#include <QtTest/QtTest>

#include <algorithm>

#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

#include "slotplanner/core/Scheduler.hpp"
#include "slotplanner/core/SlotGrid.hpp"
#include "slotplanner/data/ScheduleExporter.hpp"

using namespace slotplanner;

class ScheduleExporterTest : public QObject
{
    Q_OBJECT

private slots:
    void exportsDateAndSlotKeys();
    void emptyScheduleIsEmptyObject();
    void slotKeysSortAsText();
    void writesFile();
};

void ScheduleExporterTest::exportsDateAndSlotKeys()
{
    data::Task task;
    task.title = "Review";
    task.durationMinutes = 60;
    task.importance = data::Importance::High;
    task.priority = data::Priority::HardDeadline;
    task.deadline = QDate(2024, 3, 8);

    const auto result = core::Scheduler().schedule({ task }, QDate(2024, 3, 4));
    QVERIFY(result.ok());

    const QJsonObject root = data::ScheduleExporter::toJson(result.schedule()).object();
    QCOMPARE(root.keys(), QStringList{ "2024-03-04" });

    const QJsonObject day = root.value("2024-03-04").toObject();
    QCOMPARE(day.size(), 2);
    QVERIFY(day.contains("9:00"));
    QVERIFY(day.contains("9:30"));

    const QJsonObject slot = day.value("9:30").toObject();
    QCOMPARE(slot.value("id").toString(), task.id.toString(QUuid::WithoutBraces));
    QCOMPARE(slot.value("title").toString(), QStringLiteral("Review"));
    QCOMPARE(slot.value("duration").toInt(), 60);
    QCOMPARE(slot.value("importance").toString(), QStringLiteral("High"));
    QCOMPARE(slot.value("priority").toString(), QStringLiteral("Hard deadline"));
    QCOMPARE(slot.value("deadline").toString(), QStringLiteral("2024-03-08"));
}

void ScheduleExporterTest::emptyScheduleIsEmptyObject()
{
    const auto document = data::ScheduleExporter::toJson(core::Schedule{});
    QVERIFY(document.isObject());
    QVERIFY(document.object().isEmpty());
}

void ScheduleExporterTest::slotKeysSortAsText()
{
    data::Task task;
    task.title = "Long";
    task.durationMinutes = 90;
    task.deadline = QDate(2024, 3, 8);
    data::Task later;
    later.title = "Later";
    later.deadline = QDate(2024, 3, 9);

    const auto result = core::Scheduler().schedule({ task, later }, QDate(2024, 3, 4));
    QVERIFY(result.ok());
    const QJsonObject day = data::ScheduleExporter::toJson(result.schedule())
                                .object()
                                .value("2024-03-04")
                                .toObject();
    QCOMPARE(day.keys(), (QStringList{ "10:00", "10:30", "9:00", "9:30" }));

    const auto grid = core::SlotGrid::create();
    QVERIFY(grid.has_value());
    QStringList ordered = day.keys();
    std::sort(ordered.begin(), ordered.end(), [&grid](const QString &a, const QString &b) {
        return grid->indexOf(a) < grid->indexOf(b);
    });
    QCOMPARE(ordered, (QStringList{ "9:00", "9:30", "10:00", "10:30" }));
    QCOMPARE(day.value("10:30").toObject().value("title").toString(), QStringLiteral("Later"));
}

void ScheduleExporterTest::writesFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("out/schedule.json");

    data::Task task;
    task.title = "Write";
    core::Schedule schedule;
    QVERIFY(schedule.assign(QDate(2024, 1, 2), "10:00", task));
    QVERIFY(data::ScheduleExporter::writeToFile(schedule, path));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto document = QJsonDocument::fromJson(file.readAll());
    QCOMPARE(document.object().value("2024-01-02").toObject().value("10:00").toObject().value("title").toString(),
             QStringLiteral("Write"));

    QVERIFY(!data::ScheduleExporter::writeToFile(schedule, QString()));
}

QTEST_GUILESS_MAIN(ScheduleExporterTest)
#include "ScheduleExporterTest.moc"
