#pragma once

#include <optional>
#include <vector>

#include "slotplanner/data/Task.hpp"

namespace slotplanner {
namespace data {

// Tasks are returned in creation order.
class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::optional<Task> findById(const QUuid &id) const = 0;
    // std::nullopt when the task could not be stored.
    virtual std::optional<Task> addTask(Task task) = 0;
    virtual bool updateTask(const Task &task) = 0;
    virtual bool removeTask(const QUuid &id) = 0;
};

} // namespace data
} // namespace slotplanner
