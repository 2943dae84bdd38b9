#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system, with keyed serial
///        execution for per-session ordering.

#include "sgw/foundation/service_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace sgw::foundation {

/// Thread-pool backed job scheduler.
///
/// Two submission modes:
/// - schedule(): independent job, runs on any worker.
/// - scheduleSerial(key, job): jobs sharing a key run one at a time in
///   submission order; different keys run in parallel. The engine keys
///   input by session id so a slow command in one session never delays
///   another, while each session still sees its input in FIFO order.
///
/// Tick jobs are driven by processTick() from the owning thread's loop.
///
/// @code
///   JobScheduler scheduler(4);
///   scheduler.scheduleSerial(sid.value(), [=] { handle(sid, line); });
///   scheduler.waitIdle(std::chrono::seconds(5));
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Schedule an independent job.
    ServiceResult<JobId> schedule(JobFunc job);

    /// Schedule a job behind every earlier job submitted with the same key.
    ServiceResult<JobId> scheduleSerial(uint64_t key, JobFunc job);

    /// Register a recurring job that fires every @p interval of processTick() time.
    ServiceResult<JobId> scheduleTick(std::chrono::milliseconds interval, JobFunc job);

    /// Advance tick timers by @p deltaTime and dispatch due tick jobs.
    void processTick(std::chrono::milliseconds deltaTime);

    /// Disable a tick job.
    ServiceResult<void> cancelTick(JobId id);

    /// Block until every submitted job has finished or @p timeout elapses.
    /// @return true if the scheduler drained in time.
    bool waitIdle(std::chrono::milliseconds timeout);

    /// Number of submitted jobs that have not finished yet.
    [[nodiscard]] std::size_t pendingJobs() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sgw::foundation
