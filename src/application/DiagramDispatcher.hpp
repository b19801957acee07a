/**
 * @file DiagramDispatcher.hpp
 * @brief Bounded-concurrency execution of a batch of diagram jobs.
 */

#pragma once

#include "application/DiagramJob.hpp"
#include "domain/JobOutcome.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace systemviz::application {

/**
 * @enum JobState
 * @brief Per-job lifecycle reported to the observer.
 */
enum class JobState {
    Pending,
    Running,
    Succeeded, ///< Also used for skipped (nothing to draw) jobs.
    Failed
};

/**
 * @enum BatchState
 * @brief Batch lifecycle reported to the observer.
 */
enum class BatchState {
    Started,
    Running,
    Complete
};

/**
 * @struct BatchReport
 * @brief Every job's outcome, in submission order, plus the aggregate counts.
 */
struct BatchReport {
    std::vector<domain::JobOutcome> outcomes;
    size_t succeeded = 0;
    size_t skipped = 0;
    size_t failed = 0;

    bool hasFailures() const { return failed > 0; }
    /** @brief A clean run has no failed job; skipped jobs do not count. */
    bool isClean() const { return failed == 0; }
};

/**
 * @class DiagramDispatcher
 * @brief Fixed worker pool fed from a queue of job indices.
 *
 * At most `concurrency` jobs execute at once. Run() blocks until every job
 * has a terminal outcome. An exception escaping a job is recorded as that
 * job's Failed outcome and never reaches sibling jobs or the caller.
 */
class DiagramDispatcher {
public:
    using JobObserver = std::function<void(size_t index, const DiagramJob& job, JobState state)>;
    using BatchObserver = std::function<void(BatchState state)>;

    /** @param concurrency Upper bound on simultaneously running jobs; 0 is treated as 1. */
    explicit DiagramDispatcher(unsigned concurrency);

    /**
     * @brief Observer calls are serialized; they may come from any worker thread.
     *
     * An exception thrown by an observer is logged and does not affect the job.
     */
    void SetJobObserver(JobObserver observer) { m_jobObserver = std::move(observer); }
    void SetBatchObserver(BatchObserver observer) { m_batchObserver = std::move(observer); }

    /**
     * @brief Runs every job and waits for all of them.
     * @param context Shared resources; its cancel flag is replaced by the dispatcher's own.
     */
    BatchReport Run(const std::vector<std::unique_ptr<DiagramJob>>& jobs, const JobContext& context);

    /**
     * @brief Jobs not yet started end as Cancelled; running renderers are killed.
     *
     * Safe to call from any thread. A cancelled dispatcher stays cancelled.
     */
    void Cancel() { m_cancelled = true; }
    bool IsCancelled() const { return m_cancelled.load(); }

    unsigned GetConcurrency() const { return m_concurrency; }

private:
    domain::JobOutcome RunOne(size_t index, const DiagramJob& job, const JobContext& context);
    void NotifyJob(size_t index, const DiagramJob& job, JobState state);
    void NotifyBatch(BatchState state);
    void LogOutcome(const domain::JobOutcome& outcome);

    unsigned m_concurrency;
    std::atomic<bool> m_cancelled{false};
    JobObserver m_jobObserver;
    BatchObserver m_batchObserver;
    std::mutex m_observerMutex;
    std::mutex m_logMutex;
};

} // namespace systemviz::application
