#include <QtTest/QtTest>

#include "slotplanner/data/Task.hpp"

using namespace slotplanner::data;

class TaskTest : public QObject
{
    Q_OBJECT

private slots:
    void defaults();
    void importanceLabels();
    void priorityLabels();
    void rejectsUnknownLabels();
};

void TaskTest::defaults()
{
    const Task task;
    QVERIFY(!task.id.isNull());
    QCOMPARE(task.durationMinutes, 30);
    QCOMPARE(task.importance, Importance::Average);
    QCOMPARE(task.priority, Priority::SoftDeadline);
    QCOMPARE(task.deadline, QDate::currentDate());
    QVERIFY(Task{}.id != task.id);
}

void TaskTest::importanceLabels()
{
    QCOMPARE(importanceToString(Importance::Asap), QStringLiteral("ASAP"));
    QCOMPARE(importanceToString(Importance::Low), QStringLiteral("Low"));
    QCOMPARE(importanceFromString("asap"), std::optional<Importance>(Importance::Asap));
    QCOMPARE(importanceFromString(" High "), std::optional<Importance>(Importance::High));
    QCOMPARE(importanceFromString(importanceToString(Importance::Average)),
             std::optional<Importance>(Importance::Average));
}

void TaskTest::priorityLabels()
{
    QCOMPARE(priorityToString(Priority::HardDeadline), QStringLiteral("Hard deadline"));
    QCOMPARE(priorityToString(Priority::NoDeadline), QStringLiteral("No deadline"));
    QCOMPARE(priorityFromString("Soft deadline"), std::optional<Priority>(Priority::SoftDeadline));
    QCOMPARE(priorityFromString("HardDeadline"), std::optional<Priority>(Priority::HardDeadline));
    QCOMPARE(priorityFromString("no-deadline"), std::optional<Priority>(Priority::NoDeadline));
    QCOMPARE(priorityFromString("ASAP"), std::optional<Priority>(Priority::Asap));
}

void TaskTest::rejectsUnknownLabels()
{
    QVERIFY(!importanceFromString("urgent").has_value());
    QVERIFY(!importanceFromString(QString()).has_value());
    QVERIFY(!priorityFromString("deadline").has_value());
}

QTEST_GUILESS_MAIN(TaskTest)
#include "TaskTest.moc"
