#include "slotplanner/data/DataProvider.hpp"

#include "slotplanner/data/FileTaskRepository.hpp"
#include "slotplanner/data/FileTaskStorage.hpp"
#include "slotplanner/data/TaskRepository.hpp"

#include <QDir>
#include <QStandardPaths>

namespace slotplanner {
namespace data {

DataProvider::DataProvider(const QString &storePath)
{
    const QString filePath = storePath.isEmpty() ? defaultStorePath() : storePath;
    m_taskStorage = std::make_shared<FileTaskStorage>(filePath);
    m_taskRepository = std::make_unique<FileTaskRepository>(m_taskStorage);
}

DataProvider::~DataProvider() = default;

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

QString DataProvider::storePath() const
{
    return m_taskStorage->filePath();
}

QString DataProvider::defaultStorePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/slotplanner");
    }
    QDir dir(storageFolder);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("tasks.ics"));
}

} // namespace data
} // namespace slotplanner
