/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "sgw/foundation/job_scheduler.hpp"

#include "sgw/foundation/service_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sgw::foundation {

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    struct TickEntry {
        JobId id;
        std::chrono::milliseconds interval;
        std::chrono::milliseconds elapsed{0};
        JobFunc func;
        bool enabled{true};
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};

    // Keys with a drain job in flight; the deque holds jobs queued behind it.
    std::unordered_map<uint64_t, std::deque<JobFunc>> serialQueues;

    std::vector<TickEntry> tickJobs;

    mutable std::mutex mutex;
    std::condition_variable idleCv;
    std::size_t pending = 0;

    static void runGuarded(const JobFunc& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            SGW_LOG_ERROR(LogCategory::Core, std::string("job failed: ") + e.what());
        }
    }

    void finishOne() {
        std::lock_guard lock(mutex);
        if (pending > 0) {
            --pending;
        }
        if (pending == 0) {
            idleCv.notify_all();
        }
    }

    bool enqueue(const std::string& name, JobFunc fn) {
        auto threadJob = kcenon::thread::job_builder()
            .name(name)
            .work([fn = std::move(fn)]() -> kcenon::common::VoidResult {
                fn();
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        auto result = pool->enqueue(std::move(threadJob));
        return !result.is_err();
    }

    // Runs queued jobs for one key back to back until its queue is empty.
    void drainSerial(uint64_t key, JobFunc first) {
        JobFunc current = std::move(first);
        while (current) {
            runGuarded(current);
            finishOne();

            std::lock_guard lock(mutex);
            auto it = serialQueues.find(key);
            if (it == serialQueues.end() || it->second.empty()) {
                serialQueues.erase(key);
                current = nullptr;
            } else {
                current = std::move(it->second.front());
                it->second.pop_front();
            }
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("SgwJobScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
ServiceResult<JobScheduler::JobId> JobScheduler::schedule(JobFunc job) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(impl_->mutex);
        ++impl_->pending;
    }

    auto* self = impl_.get();
    bool queued = impl_->enqueue("sgw_job_" + std::to_string(id),
        [self, fn = std::move(job)]() {
            Impl::runGuarded(fn);
            self->finishOne();
        });

    if (!queued) {
        impl_->finishOne();
        return ServiceResult<JobId>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return ServiceResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// scheduleSerial()
// ---------------------------------------------------------------------------
ServiceResult<JobScheduler::JobId> JobScheduler::scheduleSerial(uint64_t key, JobFunc job) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(impl_->mutex);
        ++impl_->pending;
        auto it = impl_->serialQueues.find(key);
        if (it != impl_->serialQueues.end()) {
            // A drain job for this key is running; it will pick this one up.
            it->second.push_back(std::move(job));
            return ServiceResult<JobId>::ok(id);
        }
        impl_->serialQueues.emplace(key, std::deque<JobFunc>{});
    }

    auto* self = impl_.get();
    bool queued = impl_->enqueue("sgw_serial_" + std::to_string(key),
        [self, key, fn = std::move(job)]() mutable {
            self->drainSerial(key, std::move(fn));
        });

    if (!queued) {
        {
            std::lock_guard lock(impl_->mutex);
            impl_->serialQueues.erase(key);
        }
        impl_->finishOne();
        return ServiceResult<JobId>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "failed to enqueue serial job"));
    }
    return ServiceResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// Ticks
// ---------------------------------------------------------------------------
ServiceResult<JobScheduler::JobId> JobScheduler::scheduleTick(
    std::chrono::milliseconds interval, JobFunc job)
{
    if (interval.count() <= 0) {
        return ServiceResult<JobId>::err(
            ServiceError(ErrorCode::InvalidArgument, "tick interval must be positive"));
    }
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(impl_->mutex);
    impl_->tickJobs.push_back(
        Impl::TickEntry{id, interval, std::chrono::milliseconds{0}, std::move(job), true});

    return ServiceResult<JobId>::ok(id);
}

void JobScheduler::processTick(std::chrono::milliseconds deltaTime) {
    std::vector<std::pair<JobId, JobFunc>> due;
    {
        std::lock_guard lock(impl_->mutex);
        for (auto& tick : impl_->tickJobs) {
            if (!tick.enabled) {
                continue;
            }
            tick.elapsed += deltaTime;
            if (tick.elapsed >= tick.interval) {
                tick.elapsed = std::chrono::milliseconds{0};
                due.emplace_back(tick.id, tick.func);
            }
        }
    }

    // Each tick entry is serialized on its own key so a slow tick never
    // overlaps with its next firing.
    for (auto& [id, fn] : due) {
        auto result = scheduleSerial(id | (uint64_t{1} << 63), std::move(fn));
        if (result.hasError()) {
            SGW_LOG_WARN(LogCategory::Core, "failed to dispatch tick job " + std::to_string(id));
        }
    }
}

ServiceResult<void> JobScheduler::cancelTick(JobId id) {
    std::lock_guard lock(impl_->mutex);
    for (auto& tick : impl_->tickJobs) {
        if (tick.id == id) {
            tick.enabled = false;
            return ServiceResult<void>::ok();
        }
    }
    return ServiceResult<void>::err(ServiceError(ErrorCode::JobNotFound, "tick job not found"));
}

// ---------------------------------------------------------------------------
// waitIdle() / pendingJobs()
// ---------------------------------------------------------------------------
bool JobScheduler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(impl_->mutex);
    return impl_->idleCv.wait_for(lock, timeout, [this] { return impl_->pending == 0; });
}

std::size_t JobScheduler::pendingJobs() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->pending;
}

} // namespace sgw::foundation
