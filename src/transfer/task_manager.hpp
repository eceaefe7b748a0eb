#ifndef PORTAL_TRANSFER_TASK_MANAGER_HPP
#define PORTAL_TRANSFER_TASK_MANAGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "transfer/master.hpp"
#include "util/channel.hpp"
#include "util/logger.hpp"

namespace portal {
namespace transfer {

enum class TaskState {
    Running,
    Paused,
    Aborted,
    Completed,
    Failed
};

inline const char *taskStateName(TaskState state)
{
    switch (state) {
    case TaskState::Running:   return "running";
    case TaskState::Paused:    return "paused";
    case TaskState::Aborted:   return "aborted";
    case TaskState::Completed: return "completed";
    case TaskState::Failed:    return "failed";
    }
    return "unknown";
}

/**
 * @struct TaskInfo
 * @brief Snapshot of one task as shown by list().
 */
struct TaskInfo
{
    uint32_t id = 0;
    std::string path;
    TaskState state = TaskState::Running;
    std::optional<TransferOutcome> outcome; ///< set once the job reported
};

/**
 * @class TaskManager
 * @brief Numbers the transfers started over one Master and routes
 *        pause/resume/abort to the right control channel.
 *
 * State changes requested here are what the user asked for; the state
 * reported after poll() is what the transfer actually did.
 */
class TaskManager
{
public:
    explicit TaskManager(Master &master) : master_(master) {}

    /// Start sending @p path; returns the new task id.
    uint32_t send(const std::string &path)
    {
        TransferHandle handle = master_.sendFile(path);
        std::lock_guard<std::mutex> lock(mutex_);
        uint32_t id = nextId_++;
        Task &task = tasks_[id];
        task.info.id = id;
        task.info.path = path;
        task.control = std::move(handle.control);
        task.result = std::move(handle.result);
        util::logger::info("[TaskManager] Task " + std::to_string(id) + " started for " + path);
        return id;
    }

    /// @return false if @p id is unknown or not running.
    bool pause(uint32_t id) { return transition(id, TaskState::Running, TaskState::Paused, TaskControl::Paused); }

    /// @return false if @p id is unknown or not paused.
    bool resume(uint32_t id) { return transition(id, TaskState::Paused, TaskState::Running, TaskControl::Running); }

    /// @return false if @p id is unknown or already finished.
    bool abort(uint32_t id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.finished) {
            return false;
        }
        Task &task = it->second;
        if (task.info.state == TaskState::Aborted) {
            return true;
        }
        if (!task.control.send(TaskControl::Aborted)) {
            util::logger::debug("[TaskManager] Task " + std::to_string(id) + " already stopped");
        }
        task.info.state = TaskState::Aborted;
        return true;
    }

    /**
     * @brief Collect outcomes of tasks that finished since the last call.
     *        Never blocks.
     */
    std::vector<TransferOutcome> poll()
    {
        std::vector<TransferOutcome> finished;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &entry : tasks_) {
            Task &task = entry.second;
            if (task.finished) {
                continue;
            }
            TransferOutcome outcome;
            util::RecvStatus status = task.result.tryRecv(outcome);
            if (status == util::RecvStatus::Empty) {
                continue;
            }
            if (status == util::RecvStatus::Disconnected) {
                outcome.path = task.info.path;
                outcome.fileName = task.info.path;
                outcome.status = TransferOutcome::Status::Failed;
                outcome.message = "transfer ended without reporting an outcome";
            }
            task.finished = true;
            task.info.state = stateFor(outcome.status);
            task.info.outcome = outcome;
            finished.push_back(std::move(outcome));
        }
        return finished;
    }

    std::vector<TaskInfo> list() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TaskInfo> infos;
        infos.reserve(tasks_.size());
        for (const auto &entry : tasks_) {
            infos.push_back(entry.second.info);
        }
        return infos;
    }

    std::optional<TaskInfo> find(uint32_t id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return std::nullopt;
        }
        return it->second.info;
    }

    /// Tasks without a reported outcome.
    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto &entry : tasks_) {
            if (!entry.second.finished) {
                ++count;
            }
        }
        return count;
    }

private:
    struct Task
    {
        TaskInfo info;
        util::Sender<TaskControl> control;
        util::Receiver<TransferOutcome> result;
        bool finished = false;
    };

    static TaskState stateFor(TransferOutcome::Status status)
    {
        switch (status) {
        case TransferOutcome::Status::Completed: return TaskState::Completed;
        case TransferOutcome::Status::Aborted:   return TaskState::Aborted;
        case TransferOutcome::Status::Failed:    return TaskState::Failed;
        }
        return TaskState::Failed;
    }

    bool transition(uint32_t id, TaskState from, TaskState to, TaskControl signal)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end() || it->second.finished || it->second.info.state != from) {
            return false;
        }
        if (!it->second.control.send(signal)) {
            util::logger::debug("[TaskManager] Task " + std::to_string(id) + " already stopped");
        }
        it->second.info.state = to;
        util::logger::info("[TaskManager] Task " + std::to_string(id) + " " + taskStateName(to));
        return true;
    }

    Master &master_;
    mutable std::mutex mutex_;
    std::map<uint32_t, Task> tasks_;
    uint32_t nextId_ = 1;
};

} // namespace transfer
} // namespace portal

#endif // PORTAL_TRANSFER_TASK_MANAGER_HPP
