#include "slotplanner/data/InMemoryTaskRepository.hpp"

namespace slotplanner {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_order.size()));
    for (const auto &id : m_order) {
        tasks.push_back(m_items.value(id));
    }
    return tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QUuid &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

std::optional<Task> InMemoryTaskRepository::addTask(Task task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    if (!m_items.contains(task.id)) {
        m_order.append(task.id);
    }
    m_items.insert(task.id, task);
    return task;
}

bool InMemoryTaskRepository::updateTask(const Task &task)
{
    if (!m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskRepository::removeTask(const QUuid &id)
{
    if (m_items.remove(id) == 0) {
        return false;
    }
    m_order.removeAll(id);
    return true;
}

} // namespace data
} // namespace slotplanner
