#include "application/DiagramDispatcher.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <queue>
#include <thread>

namespace systemviz::application {

DiagramDispatcher::DiagramDispatcher(unsigned concurrency)
    : m_concurrency(std::max(concurrency, 1u))
{}

void DiagramDispatcher::NotifyJob(size_t index, const DiagramJob& job, JobState state) {
    if (!m_jobObserver) return;
    std::lock_guard<std::mutex> lock(m_observerMutex);
    try {
        m_jobObserver(index, job, state);
    } catch (const std::exception& e) {
        std::cerr << "[Dispatcher] Job observer failed for " << job.family() << " " << job.scopeKey()
                  << ": " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[Dispatcher] Job observer failed for " << job.family() << " " << job.scopeKey()
                  << ": unknown error" << std::endl;
    }
}

void DiagramDispatcher::NotifyBatch(BatchState state) {
    if (!m_batchObserver) return;
    std::lock_guard<std::mutex> lock(m_observerMutex);
    try {
        m_batchObserver(state);
    } catch (const std::exception& e) {
        std::cerr << "[Dispatcher] Batch observer failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[Dispatcher] Batch observer failed: unknown error" << std::endl;
    }
}

void DiagramDispatcher::LogOutcome(const domain::JobOutcome& outcome) {
    std::lock_guard<std::mutex> lock(m_logMutex);
    if (domain::IsFailure(outcome.status)) {
        std::cerr << "[Dispatcher] " << outcome.family << " " << outcome.scopeKey << ": FAILED: "
                  << domain::ToString(outcome.status);
        if (!outcome.message.empty()) std::cerr << " - " << outcome.message;
        std::cerr << std::endl;
    } else {
        std::cout << "[Dispatcher] " << outcome.family << " " << outcome.scopeKey << ": "
                  << domain::ToString(outcome.status) << std::endl;
    }
}

domain::JobOutcome DiagramDispatcher::RunOne(size_t index, const DiagramJob& job, const JobContext& context) {
    domain::JobOutcome outcome;

    if (m_cancelled) {
        outcome.scopeKey = job.scopeKey();
        outcome.family = job.family();
        outcome.status = domain::JobStatus::Cancelled;
        outcome.message = "batch cancelled before the job started";
    } else {
        NotifyJob(index, job, JobState::Running);
        try {
            outcome = job.Execute(context);
        } catch (const std::exception& e) {
            outcome.scopeKey = job.scopeKey();
            outcome.family = job.family();
            outcome.status = domain::JobStatus::Failed;
            outcome.message = e.what();
        } catch (...) {
            outcome.scopeKey = job.scopeKey();
            outcome.family = job.family();
            outcome.status = domain::JobStatus::Failed;
            outcome.message = "Unknown error during job execution.";
        }
    }

    NotifyJob(index, job, domain::IsFailure(outcome.status) ? JobState::Failed : JobState::Succeeded);
    LogOutcome(outcome);
    return outcome;
}

BatchReport DiagramDispatcher::Run(const std::vector<std::unique_ptr<DiagramJob>>& jobs, const JobContext& context) {
    BatchReport report;
    report.outcomes.resize(jobs.size());

    JobContext jobContext = context;
    jobContext.cancelled = &m_cancelled;

    NotifyBatch(BatchState::Started);
    for (size_t i = 0; i < jobs.size(); ++i) {
        NotifyJob(i, *jobs[i], JobState::Pending);
    }

    const size_t workers = std::min<size_t>(m_concurrency, jobs.size());
    std::cout << "[Dispatcher] Running " << jobs.size() << " jobs on "
              << std::max<size_t>(workers, 1) << " worker(s)" << std::endl;
    NotifyBatch(BatchState::Running);

    if (workers <= 1) {
        for (size_t i = 0; i < jobs.size(); ++i) {
            report.outcomes[i] = RunOne(i, *jobs[i], jobContext);
        }
    } else {
        std::queue<size_t> pending;
        for (size_t i = 0; i < jobs.size(); ++i) {
            pending.push(i);
        }
        std::mutex queueMutex;

        auto worker = [&]() {
            while (true) {
                size_t index;
                {
                    std::lock_guard<std::mutex> lock(queueMutex);
                    if (pending.empty()) return;
                    index = pending.front();
                    pending.pop();
                }
                // Each worker writes a distinct slot.
                report.outcomes[index] = RunOne(index, *jobs[index], jobContext);
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    for (const auto& outcome : report.outcomes) {
        if (outcome.status == domain::JobStatus::SkippedEmpty) {
            ++report.skipped;
        } else if (domain::IsFailure(outcome.status)) {
            ++report.failed;
        } else {
            ++report.succeeded;
        }
    }

    std::ostream& summary = report.hasFailures() ? std::cerr : std::cout;
    summary << "[Dispatcher] Batch complete: " << report.succeeded << " succeeded, "
            << report.skipped << " skipped, " << report.failed << " failed"
            << (report.hasFailures() ? " (degraded run)" : "") << std::endl;

    NotifyBatch(BatchState::Complete);
    return report;
}

} // namespace systemviz::application
