#include "slotplanner/data/FileTaskRepository.hpp"

namespace slotplanner {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<FileTaskStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Task> FileTaskRepository::fetchTasks() const
{
    std::vector<Task> result;
    if (!m_storage) {
        return result;
    }
    const auto &tasks = m_storage->tasks();
    const auto &order = m_storage->order();
    result.reserve(static_cast<size_t>(order.size()));
    for (const QUuid &id : order) {
        result.push_back(tasks.value(id));
    }
    return result;
}

std::optional<Task> FileTaskRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &tasks = m_storage->tasks();
    if (tasks.contains(id)) {
        return tasks.value(id);
    }
    return std::nullopt;
}

std::optional<Task> FileTaskRepository::addTask(Task task)
{
    if (!m_storage) {
        return std::nullopt;
    }
    return m_storage->addOrUpdateTask(std::move(task));
}

bool FileTaskRepository::updateTask(const Task &task)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->tasks().contains(task.id)) {
        return false;
    }
    return m_storage->addOrUpdateTask(task).has_value();
}

bool FileTaskRepository::removeTask(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeTask(id);
}

} // namespace data
} // namespace slotplanner
