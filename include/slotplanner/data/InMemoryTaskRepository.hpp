#pragma once

#include <QHash>
#include <QVector>

#include "slotplanner/data/TaskRepository.hpp"

namespace slotplanner {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QUuid &id) const override;
    std::optional<Task> addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(const QUuid &id) override;

private:
    QHash<QUuid, Task> m_items;
    QVector<QUuid> m_order;
};

} // namespace data
} // namespace slotplanner
