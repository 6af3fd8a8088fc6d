#pragma once

#include <memory>
#include <QString>

namespace slotplanner {
namespace data {

class TaskRepository;
class FileTaskStorage;

class DataProvider
{
public:
    // An empty path selects tasks.ics in the application data directory.
    explicit DataProvider(const QString &storePath = QString());
    ~DataProvider();

    TaskRepository &taskRepository();
    QString storePath() const;

    static QString defaultStorePath();

private:
    std::shared_ptr<FileTaskStorage> m_taskStorage;
    std::unique_ptr<TaskRepository> m_taskRepository;
};

} // namespace data
} // namespace slotplanner
