#include <QtTest/QtTest>

#include "slotplanner/core/Ranking.hpp"

using namespace slotplanner;

namespace {
data::Task makeTask(const QString &title, data::Priority priority, data::Importance importance, const QDate &deadline)
{
    data::Task task;
    task.title = title;
    task.priority = priority;
    task.importance = importance;
    task.deadline = deadline;
    return task;
}

QStringList titles(const std::vector<data::Task> &tasks)
{
    QStringList result;
    for (const auto &task : tasks) {
        result << task.title;
    }
    return result;
}
} // namespace

class RankingTest : public QObject
{
    Q_OBJECT

private slots:
    void rankValues();
    void priorityBeatsImportance();
    void importanceBeatsDeadline();
    void earlierDeadlineFirst();
    void fullTiesKeepInputOrder();
};

void RankingTest::rankValues()
{
    QCOMPARE(core::priorityRank(data::Priority::Asap), 0);
    QCOMPARE(core::priorityRank(data::Priority::HardDeadline), 1);
    QCOMPARE(core::priorityRank(data::Priority::SoftDeadline), 2);
    QCOMPARE(core::priorityRank(data::Priority::NoDeadline), 3);
    QCOMPARE(core::importanceRank(data::Importance::Asap), 0);
    QCOMPARE(core::importanceRank(data::Importance::High), 1);
    QCOMPARE(core::importanceRank(data::Importance::Average), 2);
    QCOMPARE(core::importanceRank(data::Importance::Low), 3);
}

void RankingTest::priorityBeatsImportance()
{
    const QDate day(2024, 3, 1);
    const auto ranked = core::rankTasks({
        makeTask("no-deadline", data::Priority::NoDeadline, data::Importance::Asap, day),
        makeTask("hard", data::Priority::HardDeadline, data::Importance::Low, day),
        makeTask("soft", data::Priority::SoftDeadline, data::Importance::High, day),
        makeTask("asap", data::Priority::Asap, data::Importance::Low, day),
    });
    QCOMPARE(titles(ranked), (QStringList{ "asap", "hard", "soft", "no-deadline" }));
}

void RankingTest::importanceBeatsDeadline()
{
    const auto ranked = core::rankTasks({
        makeTask("low-early", data::Priority::SoftDeadline, data::Importance::Low, QDate(2024, 1, 1)),
        makeTask("high-late", data::Priority::SoftDeadline, data::Importance::High, QDate(2024, 12, 31)),
    });
    QCOMPARE(titles(ranked), (QStringList{ "high-late", "low-early" }));
}

void RankingTest::earlierDeadlineFirst()
{
    const auto later = makeTask("later", data::Priority::HardDeadline, data::Importance::High, QDate(2024, 5, 2));
    const auto earlier = makeTask("earlier", data::Priority::HardDeadline, data::Importance::High, QDate(2024, 5, 1));
    QVERIFY(core::ranksBefore(earlier, later));
    QVERIFY(!core::ranksBefore(later, earlier));
    QVERIFY(!core::ranksBefore(earlier, earlier));
}

void RankingTest::fullTiesKeepInputOrder()
{
    const QDate day(2024, 3, 1);
    std::vector<data::Task> tasks;
    for (int i = 0; i < 6; ++i) {
        tasks.push_back(makeTask(QString::number(i), data::Priority::SoftDeadline, data::Importance::Average, day));
    }
    tasks.insert(tasks.begin() + 3, makeTask("urgent", data::Priority::Asap, data::Importance::Asap, day));

    const auto ranked = core::rankTasks(tasks);
    QCOMPARE(titles(ranked), (QStringList{ "urgent", "0", "1", "2", "3", "4", "5" }));
}

QTEST_GUILESS_MAIN(RankingTest)
#include "RankingTest.moc"
