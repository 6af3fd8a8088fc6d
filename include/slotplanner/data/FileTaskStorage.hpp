#pragma once

#include <QHash>
#include <QString>
#include <QUuid>
#include <QVector>
#include <optional>

#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace data {

// Persists tasks as VTODO components of an iCalendar file. Every mutation
// rewrites the whole file.
class FileTaskStorage
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() = default;

    const QString &filePath() const;
    const QHash<QUuid, Task> &tasks() const;
    // Ids in creation order.
    const QVector<QUuid> &order() const;

    // Both leave the stored tasks unchanged when the file cannot be written.
    std::optional<Task> addOrUpdateTask(Task task);
    bool removeTask(const QUuid &id);

    // False when the file could not be written.
    bool lastSaveSucceeded() const;

private:
    void load();
    void save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);

    QString m_filePath;
    QHash<QUuid, Task> m_tasks;
    QVector<QUuid> m_order;
    mutable bool m_lastSaveSucceeded = true;
};

} // namespace data
} // namespace slotplanner
