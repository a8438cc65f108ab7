/// @file task_scheduler.hpp
/// @brief Cooperative per-frame task scheduling with cancellable handles.
///
/// Every live task is ticked exactly once per frame, in spawn order. Tasks
/// suspend only at frame boundaries: a tick does one frame of work and
/// returns. Cancellation is cooperative: cancelling a handle sets a shared
/// stop flag, and the scheduler drops the task before its next tick without
/// ticking it again.

#pragma once

#include "timing/frame_clock.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace statgauge {

/// A unit of work advanced once per frame.
class FrameTask {
  public:
    virtual ~FrameTask() = default;

    /// Performs one frame of work.
    /// @param clock The frame clock, already advanced for this frame
    /// @return false once the task has finished and should be dropped
    virtual bool tick(const FrameClock& clock) = 0;
};

/// Caller-side handle to a spawned task. Copies share the same stop flag.
/// A default-constructed handle refers to no task.
class TaskHandle {
  public:
    TaskHandle() = default;

    /// Stops the task. It will not be ticked again. Safe to call repeatedly
    /// and on an empty or already-finished handle.
    void cancel();

    /// Forgets the task without stopping it
    void reset() { stopped_.reset(); }

    /// True while the task is scheduled and neither cancelled nor finished
    [[nodiscard]] bool is_running() const { return stopped_ != nullptr && !*stopped_; }

    /// True if this handle refers to a task (running or not)
    [[nodiscard]] bool valid() const { return stopped_ != nullptr; }

  private:
    friend class TaskScheduler;
    explicit TaskHandle(std::shared_ptr<bool> stopped) : stopped_(std::move(stopped)) {}

    std::shared_ptr<bool> stopped_;
};

/// Owns and ticks frame tasks.
///
/// Usage:
///   1. spawn() tasks at any time, including from inside another task's tick
///   2. Each frame, advance the FrameClock, then call tick(clock)
///   3. cancel() handles to stop tasks; they are dropped on the next tick
class TaskScheduler {
  public:
    TaskScheduler() = default;
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    /// Takes ownership of a task. A task spawned during tick() first runs on
    /// the following tick.
    /// @return Handle for cancelling the task; an empty handle if task is null
    TaskHandle spawn(std::unique_ptr<FrameTask> task);

    /// Ticks every live task once and drops finished or cancelled ones
    void tick(const FrameClock& clock);

    /// Stops and drops every task, including those spawned by animators.
    /// An animator notices on its next set_target, which restarts the
    /// transition and the pulse.
    void cancel_all();

    /// Number of tasks that are scheduled and not stopped
    [[nodiscard]] size_t live_count() const;

  private:
    struct Entry {
        std::unique_ptr<FrameTask> task;
        std::shared_ptr<bool> stopped;
    };

    std::vector<Entry> tasks_;
    std::vector<Entry> spawned_; // Spawned while ticking, merged afterwards
    bool ticking_ = false;
};

} // namespace statgauge
