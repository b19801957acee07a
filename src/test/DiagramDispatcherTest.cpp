#undef NDEBUG
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/DiagramDispatcher.hpp"
#include "infrastructure/JsonEnergySystemModel.hpp"
#include "TestFixtures.hpp"

using namespace systemviz;
using systemviz::application::BatchState;
using systemviz::application::DiagramDispatcher;
using systemviz::application::DiagramJob;
using systemviz::application::JobState;
namespace fs = std::filesystem;

namespace {

/**
 * Job whose compose() runs an arbitrary action and then emits a tiny artifact
 * (or nothing when the action returns false).
 */
class ScriptedJob : public DiagramJob {
public:
    ScriptedJob(std::string name, std::function<bool()> action)
        : m_name(std::move(name)), m_action(std::move(action)) {}

    std::string family() const override { return "scripted"; }
    std::string scopeKey() const override { return m_name; }

    std::optional<application::Artifact> compose(const domain::EnergySystemModel&,
                                                 const domain::RenderConfig&) const override {
        if (!m_action()) {
            return std::nullopt;
        }
        return application::Artifact{"results/" + m_name, "strict digraph x {\n}\n"};
    }

private:
    std::string m_name;
    std::function<bool()> m_action;
};

struct Harness {
    infrastructure::JsonEnergySystemModel model =
        infrastructure::JsonEnergySystemModel::FromJson(nlohmann::json::parse(test::kMiniDataset), "mini");
    domain::RenderConfig config;
    test::FakeRenderer renderer;
    fs::path runRoot;

    explicit Harness(const fs::path& root) : runRoot(root) {
        fs::remove_all(runRoot);
        fs::create_directories(runRoot / "results");
    }

    application::JobContext context() {
        return application::JobContext{model, config, renderer, runRoot};
    }
};

} // namespace

int main() {
    std::cout << "[Test] Starting DiagramDispatcher Test..." << std::endl;

    const fs::path testRoot = fs::absolute("test_dispatcher_root");

    // Concurrency bound and submission-order outcomes.
    {
        Harness h(testRoot);
        std::atomic<int> running{0};
        std::atomic<int> maxRunning{0};

        std::vector<std::unique_ptr<DiagramJob>> jobs;
        for (int i = 0; i < 9; ++i) {
            jobs.push_back(std::make_unique<ScriptedJob>("job" + std::to_string(i), [&]() {
                int now = ++running;
                int seen = maxRunning.load();
                while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(30));
                --running;
                return true;
            }));
        }

        std::vector<BatchState> batchStates;
        std::vector<std::vector<JobState>> jobStates(jobs.size());
        DiagramDispatcher dispatcher(2);
        dispatcher.SetBatchObserver([&](BatchState state) { batchStates.push_back(state); });
        dispatcher.SetJobObserver([&](size_t index, const DiagramJob&, JobState state) {
            jobStates[index].push_back(state);
        });

        auto report = dispatcher.Run(jobs, h.context());
        assert(maxRunning.load() <= 2);
        assert(maxRunning.load() >= 1);
        assert(report.outcomes.size() == 9);
        for (size_t i = 0; i < report.outcomes.size(); ++i) {
            assert(report.outcomes[i].scopeKey == "job" + std::to_string(i));
            assert(report.outcomes[i].status == domain::JobStatus::Succeeded);
            assert(fs::exists(h.runRoot / "results" / ("job" + std::to_string(i) + ".dot")));
            assert((jobStates[i] == std::vector<JobState>{JobState::Pending, JobState::Running, JobState::Succeeded}));
        }
        assert(report.succeeded == 9);
        assert(report.isClean());
        assert((batchStates == std::vector<BatchState>{BatchState::Started, BatchState::Running, BatchState::Complete}));
        assert(h.renderer.requests().size() == 9);
        std::cout << "[PASS] At most two jobs ran at once; outcomes in submission order." << std::endl;
    }

    // Failures stay inside their job.
    {
        Harness h(testRoot);
        std::vector<std::unique_ptr<DiagramJob>> jobs;
        jobs.push_back(std::make_unique<ScriptedJob>("ok", []() { return true; }));
        jobs.push_back(std::make_unique<ScriptedJob>("throws", []() -> bool {
            throw std::runtime_error("compose exploded");
        }));
        jobs.push_back(std::make_unique<ScriptedJob>("throws_int", []() -> bool { throw 42; }));
        jobs.push_back(std::make_unique<ScriptedJob>("empty", []() { return false; }));
        jobs.push_back(std::make_unique<ScriptedJob>("ok_again", []() { return true; }));

        std::vector<JobState> finalStates(jobs.size(), JobState::Pending);
        DiagramDispatcher dispatcher(3);
        dispatcher.SetJobObserver([&](size_t index, const DiagramJob&, JobState state) {
            finalStates[index] = state;
        });
        auto report = dispatcher.Run(jobs, h.context());

        assert(report.outcomes[0].status == domain::JobStatus::Succeeded);
        assert(report.outcomes[1].status == domain::JobStatus::Failed);
        assert(report.outcomes[1].message == "compose exploded");
        assert(report.outcomes[2].status == domain::JobStatus::Failed);
        assert(report.outcomes[3].status == domain::JobStatus::SkippedEmpty);
        assert(report.outcomes[3].artifactPath.empty());
        assert(report.outcomes[4].status == domain::JobStatus::Succeeded);
        assert(report.succeeded == 2);
        assert(report.skipped == 1);
        assert(report.failed == 2);
        assert(report.hasFailures());
        assert(!report.isClean());
        assert(finalStates[1] == JobState::Failed);
        assert(finalStates[3] == JobState::Succeeded);
        std::cout << "[PASS] Exceptions become Failed outcomes." << std::endl;
    }

    // Renderer failure only fails that job.
    {
        Harness h(testRoot);
        test::FakeRenderer picky("bad.dot");
        application::JobContext ctx{h.model, h.config, picky, h.runRoot};

        std::vector<std::unique_ptr<DiagramJob>> jobs;
        jobs.push_back(std::make_unique<ScriptedJob>("good", []() { return true; }));
        jobs.push_back(std::make_unique<ScriptedJob>("bad", []() { return true; }));

        DiagramDispatcher dispatcher(2);
        auto report = dispatcher.Run(jobs, ctx);
        assert(report.outcomes[0].status == domain::JobStatus::Succeeded);
        assert(report.outcomes[1].status == domain::JobStatus::RendererFailed);
        assert(fs::exists(h.runRoot / "results" / "bad.dot"));
        assert(report.failed == 1);
        std::cout << "[PASS] Renderer failure is isolated." << std::endl;
    }

    // Cancel from inside the first job: nothing else starts.
    {
        Harness h(testRoot);
        DiagramDispatcher dispatcher(1);
        std::atomic<int> started{0};

        std::vector<std::unique_ptr<DiagramJob>> jobs;
        jobs.push_back(std::make_unique<ScriptedJob>("first", [&]() {
            ++started;
            dispatcher.Cancel();
            return true;
        }));
        for (int i = 0; i < 4; ++i) {
            jobs.push_back(std::make_unique<ScriptedJob>("later" + std::to_string(i), [&]() {
                ++started;
                return true;
            }));
        }

        auto report = dispatcher.Run(jobs, h.context());
        assert(started.load() == 1);
        assert(dispatcher.IsCancelled());
        // The first job saw the flag between compose and render.
        assert(report.outcomes[0].status == domain::JobStatus::Cancelled ||
               report.outcomes[0].status == domain::JobStatus::Succeeded);
        for (size_t i = 1; i < report.outcomes.size(); ++i) {
            assert(report.outcomes[i].status == domain::JobStatus::Cancelled);
        }
        assert(report.outcomes.size() == 5);

        // A cancelled dispatcher stays cancelled.
        auto again = dispatcher.Run(jobs, h.context());
        assert(started.load() == 1);
        assert(again.failed == 5);
        std::cout << "[PASS] Cancellation." << std::endl;
    }

    // Concurrency 1 runs on the caller's thread; 0 is treated as 1.
    {
        Harness h(testRoot);
        const auto caller = std::this_thread::get_id();
        std::vector<std::thread::id> seen;
        std::mutex seenMutex;

        std::vector<std::unique_ptr<DiagramJob>> jobs;
        for (int i = 0; i < 3; ++i) {
            jobs.push_back(std::make_unique<ScriptedJob>("seq" + std::to_string(i), [&]() {
                std::lock_guard<std::mutex> lock(seenMutex);
                seen.push_back(std::this_thread::get_id());
                return true;
            }));
        }
        DiagramDispatcher dispatcher(0);
        assert(dispatcher.GetConcurrency() == 1);
        auto report = dispatcher.Run(jobs, h.context());
        assert(report.succeeded == 3);
        assert(seen.size() == 3);
        assert(std::all_of(seen.begin(), seen.end(), [&](std::thread::id id) { return id == caller; }));
        std::cout << "[PASS] Sequential execution." << std::endl;
    }

    // Throwing observers are logged; jobs and the batch still complete.
    {
        Harness h(testRoot);
        std::vector<std::unique_ptr<DiagramJob>> jobs;
        for (int i = 0; i < 4; ++i) {
            jobs.push_back(std::make_unique<ScriptedJob>("observed" + std::to_string(i), []() { return true; }));
        }
        std::atomic<int> jobCalls{0};
        int batchCalls = 0;
        DiagramDispatcher dispatcher(2);
        dispatcher.SetJobObserver([&](size_t, const DiagramJob&, JobState state) {
            ++jobCalls;
            if (state == JobState::Running) throw std::runtime_error("observer exploded");
            if (state == JobState::Succeeded) throw 7;
        });
        dispatcher.SetBatchObserver([&](BatchState) {
            ++batchCalls;
            throw std::logic_error("batch observer exploded");
        });

        auto report = dispatcher.Run(jobs, h.context());
        assert(report.succeeded == 4);
        assert(report.isClean());
        assert(jobCalls.load() == 12);
        assert(batchCalls == 3);
        std::cout << "[PASS] Observer exceptions do not reach the jobs." << std::endl;
    }

    // Empty batch.
    {
        Harness h(testRoot);
        std::vector<std::unique_ptr<DiagramJob>> jobs;
        DiagramDispatcher dispatcher(4);
        auto report = dispatcher.Run(jobs, h.context());
        assert(report.outcomes.empty());
        assert(report.isClean());
        std::cout << "[PASS] Empty batch." << std::endl;
    }

    fs::remove_all(testRoot);
    std::cout << "[Test] All DiagramDispatcher tests passed." << std::endl;
    return 0;
}
