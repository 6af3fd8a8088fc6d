#pragma once

#include "slotplanner/data/FileTaskStorage.hpp"
#include "slotplanner/data/TaskRepository.hpp"

#include <memory>

namespace slotplanner {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<FileTaskStorage> storage);
    ~FileTaskRepository() override = default;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QUuid &id) const override;
    std::optional<Task> addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(const QUuid &id) override;

private:
    std::shared_ptr<FileTaskStorage> m_storage;
};

} // namespace data
} // namespace slotplanner
