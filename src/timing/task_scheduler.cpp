/// @file task_scheduler.cpp
/// @brief Implements cooperative frame task scheduling

#include "timing/task_scheduler.hpp"

#include <algorithm>
#include <iterator>

namespace statgauge {

void TaskHandle::cancel() {
    if (stopped_ != nullptr) {
        *stopped_ = true;
    }
}

TaskHandle TaskScheduler::spawn(std::unique_ptr<FrameTask> task) {
    if (task == nullptr) {
        return {};
    }
    auto stopped = std::make_shared<bool>(false);
    Entry entry{std::move(task), stopped};
    if (ticking_) {
        spawned_.push_back(std::move(entry));
    } else {
        tasks_.push_back(std::move(entry));
    }
    return TaskHandle(std::move(stopped));
}

void TaskScheduler::tick(const FrameClock& clock) {
    ticking_ = true;
    // Index loop: a task may cancel a later task during its own tick
    for (size_t i = 0; i < tasks_.size(); i++) {
        Entry& entry = tasks_[i];
        if (*entry.stopped) {
            continue;
        }
        if (!entry.task->tick(clock)) {
            *entry.stopped = true;
        }
    }
    ticking_ = false;

    tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                [](const Entry& e) { return *e.stopped; }),
                 tasks_.end());

    if (!spawned_.empty()) {
        tasks_.insert(tasks_.end(), std::make_move_iterator(spawned_.begin()),
                      std::make_move_iterator(spawned_.end()));
        spawned_.clear();
    }
}

void TaskScheduler::cancel_all() {
    for (Entry& entry : tasks_) {
        *entry.stopped = true;
    }
    for (Entry& entry : spawned_) {
        *entry.stopped = true;
    }
    if (!ticking_) {
        tasks_.clear();
        spawned_.clear();
    }
}

size_t TaskScheduler::live_count() const {
    auto live = [](const Entry& e) { return !*e.stopped; };
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(), live) +
                               std::count_if(spawned_.begin(), spawned_.end(), live));
}

} // namespace statgauge
