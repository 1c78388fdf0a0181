/**
 * @file test_isolation.cpp
 * @brief Tests for process/thread workers and the isolation policy.
 */

#include "core/errors.hpp"
#include "executor/isolation.hpp"
#include "telemetry/log_sinks.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dagbuild;

// ─── Helpers ─────────────────────────────────

static std::string trace_of(auto&& fn) {
    try {
        fn();
    } catch (...) {
        return describe_exception(std::current_exception());
    }
    return {};
}

static WorkerFactory counting_factory(int& created) {
    return [&created] {
        ++created;
        return std::make_unique<ThreadWorker>();
    };
}

// ═══════════════════════════════════════════════
// ProcessWorker
// ═══════════════════════════════════════════════

TEST(ProcessWorkerTest, ReturnsReportFromChild) {
    ProcessWorker worker;
    auto report = worker.run([] {
        return TaskReport{.name = "child", .ran = true, .elapsed = Duration{1234}};
    });
    EXPECT_EQ(report.name, "child");
    EXPECT_TRUE(report.ran);
    EXPECT_EQ(report.elapsed, Duration{1234});
}

TEST(ProcessWorkerTest, ChildStateDoesNotReachParent) {
    int counter = 0;
    ProcessWorker worker;
    worker.run([&counter] {
        ++counter;
        return TaskReport{.name = "t"};
    });
    EXPECT_EQ(counter, 0);
}

TEST(ProcessWorkerTest, FailureCarriesChildTrace) {
    ProcessWorker worker;
    try {
        worker.run([]() -> TaskReport { throw std::runtime_error("exploded"); });
        FAIL() << "expected IsolatedBuildError";
    } catch (const IsolatedBuildError& e) {
        EXPECT_EQ(e.trace(), "std::runtime_error: exploded");
    }
}

TEST(ProcessWorkerTest, ChildKilledBySignal) {
    ProcessWorker worker;
    try {
        worker.run([]() -> TaskReport {
            std::raise(SIGKILL);
            return {};
        });
        FAIL() << "expected IsolatedBuildError";
    } catch (const IsolatedBuildError& e) {
        EXPECT_NE(std::string(e.what()).find("terminated by signal 9"), std::string::npos);
    }
}

TEST(ProcessWorkerTest, FlushHookRunsBeforeFork) {
    int calls = 0;
    ProcessWorker worker([&calls] { ++calls; });
    worker.run([] { return TaskReport{.name = "t"}; });
    // The child's own call happens in its copy of `calls`.
    EXPECT_EQ(calls, 1);
}

TEST(ProcessWorkerTest, ThrowingChildFlushFailsTheBuild) {
    const pid_t parent = ::getpid();
    ProcessWorker worker([parent] {
        if (::getpid() != parent) throw std::runtime_error("sink gone");
    });
    try {
        worker.run([] { return TaskReport{.name = "t"}; });
        FAIL() << "expected IsolatedBuildError";
    } catch (const IsolatedBuildError& e) {
        EXPECT_NE(e.trace().find("While flushing isolated worker output"), std::string::npos);
        EXPECT_NE(e.trace().find("std::runtime_error: sink gone"), std::string::npos);
    }
}

TEST(ProcessWorkerTest, BackgroundDescendantDoesNotDelayResponse) {
    ProcessWorker worker;
    const auto start = std::chrono::steady_clock::now();
    auto report = worker.run([] {
        if (std::system("sleep 3 >/dev/null 2>&1 &") != 0) {
            throw TaskBuildError("could not start background sleep");
        }
        return TaskReport{.name = "spawner"};
    });
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(report.name, "spawner");
    EXPECT_LT(waited, std::chrono::seconds(2));
}

// ─── Output written inside the child ─────────

class ChildOutputTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = dagbuild::test::scratch_dir("dagbuild_child_output");
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    /// Runs @p fn with file descriptor 1 pointing at @p path.
    template <typename Fn>
    static void with_stdout_to(const std::filesystem::path& path, Fn&& fn) {
        std::cout.flush();
        std::fflush(stdout);
        const int saved = ::dup(STDOUT_FILENO);
        ASSERT_GE(saved, 0);
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        ASSERT_GE(fd, 0);
        ASSERT_GE(::dup2(fd, STDOUT_FILENO), 0);
        ::close(fd);

        fn();

        std::cout.flush();
        std::fflush(stdout);
        ::dup2(saved, STDOUT_FILENO);
        ::close(saved);
    }
};

TEST_F(ChildOutputTest, StandardStreamsReachRedirectedStdout) {
    const auto out = dir_ / "stdout.txt";
    CallableTask task("printer", [](const BuildParams&) {
        std::cout << "from iostream\n";
        std::printf("from stdio\n");
    });
    IsolationStrategy isolated(true, make_worker_factory(IsolationBackend::Process));

    with_stdout_to(out, [&] { isolated.build(task, {}); });

    const auto content = dagbuild::test::read_file(out);
    EXPECT_NE(content.find("from iostream"), std::string::npos);
    EXPECT_NE(content.find("from stdio"), std::string::npos);
}

TEST_F(ChildOutputTest, LoggerLinesFromChildAreFlushed) {
    const auto path = dir_ / "run.log";
    Logger logger(std::make_unique<FileSink>(path), LogLevel::Info);
    CallableTask task("logs", [&logger](const BuildParams&) {
        logger.info("written inside the worker");
    });
    IsolationStrategy isolated(true, make_worker_factory(IsolationBackend::Process, &logger));

    isolated.build(task, {});
    logger.flush();

    EXPECT_NE(dagbuild::test::read_file(path).find("written inside the worker"),
              std::string::npos);
}

// ═══════════════════════════════════════════════
// ThreadWorker
// ═══════════════════════════════════════════════

TEST(ThreadWorkerTest, RunsOnAnotherThread) {
    std::thread::id caller = std::this_thread::get_id();
    std::thread::id ran_on;
    ThreadWorker worker;
    worker.run([&ran_on] {
        ran_on = std::this_thread::get_id();
        return TaskReport{.name = "t"};
    });
    EXPECT_NE(ran_on, caller);
}

TEST(ThreadWorkerTest, ExceptionCrossesUnchanged) {
    ThreadWorker worker;
    EXPECT_THROW(worker.run([]() -> TaskReport { throw TaskBuildError("bad"); }),
                 TaskBuildError);
}

// ═══════════════════════════════════════════════
// IsolationStrategy
// ═══════════════════════════════════════════════

TEST(IsolationStrategyTest, AppliesOnlyToCallablesWhenEnabled) {
    CallableTask callable("c", [](const BuildParams&) {});
    ShellTask shell("s", "true");

    IsolationStrategy on(true, make_worker_factory(IsolationBackend::Thread));
    IsolationStrategy off(false, make_worker_factory(IsolationBackend::Thread));

    EXPECT_TRUE(on.applies_to(callable));
    EXPECT_FALSE(on.applies_to(shell));
    EXPECT_FALSE(off.applies_to(callable));
    EXPECT_FALSE(off.applies_to(shell));
}

TEST(IsolationStrategyTest, OneWorkerPerBuild) {
    int created = 0;
    IsolationStrategy isolation(true, counting_factory(created));
    CallableTask a("a", [](const BuildParams&) {});
    CallableTask b("b", [](const BuildParams&) {});

    isolation.build(a, {});
    isolation.build(b, {});
    EXPECT_EQ(created, 2);
    EXPECT_EQ(isolation.workers_spawned(), 2u);
}

TEST(IsolationStrategyTest, FailedBuildStillConsumesOneWorker) {
    int created = 0;
    IsolationStrategy isolation(true, counting_factory(created));
    CallableTask bad("bad", [](const BuildParams&) { throw std::runtime_error("x"); });

    EXPECT_THROW(isolation.build(bad, {}), std::runtime_error);
    EXPECT_EQ(created, 1);
}

TEST(IsolationStrategyTest, ShellTaskNeverIsolated) {
    int created = 0;
    IsolationStrategy isolation(true, counting_factory(created));
    ShellTask shell("s", "true");

    auto report = isolation.build(shell, {});
    EXPECT_EQ(report.name, "s");
    EXPECT_EQ(created, 0);
}

TEST(IsolationStrategyTest, DisabledBuildsInProcess) {
    int created = 0;
    int counter = 0;
    IsolationStrategy isolation(false, counting_factory(created));
    CallableTask task("t", [&counter](const BuildParams&) { ++counter; });

    isolation.build(task, {});
    EXPECT_EQ(counter, 1);
    EXPECT_EQ(created, 0);
}

TEST(IsolationStrategyTest, ProcessFailureTextMatchesInProcess) {
    CallableTask task("t", [](const BuildParams&) { throw TaskBuildError("disk full"); });

    IsolationStrategy direct(false, {});
    IsolationStrategy isolated(true, make_worker_factory(IsolationBackend::Process));

    const auto in_process = trace_of([&] { direct.build(task, {}); });
    const auto in_worker = trace_of([&] { isolated.build(task, {}); });

    EXPECT_EQ(in_process, "dagbuild::TaskBuildError: disk full");
    EXPECT_EQ(in_worker, in_process);
}

TEST(IsolationStrategyTest, ThreadFailureTextMatchesInProcess) {
    CallableTask task("t", [](const BuildParams&) { throw std::logic_error("bad state"); });

    IsolationStrategy direct(false, {});
    IsolationStrategy isolated(true, make_worker_factory(IsolationBackend::Thread));

    EXPECT_EQ(trace_of([&] { isolated.build(task, {}); }),
              trace_of([&] { direct.build(task, {}); }));
}

TEST(IsolationStrategyTest, ParamsReachIsolatedBuild) {
    int64_t seen = 0;
    CallableTask task("t", [&seen](const BuildParams& p) {
        seen = std::get<int64_t>(p.at("n"));
    });
    IsolationStrategy isolated(true, make_worker_factory(IsolationBackend::Thread));

    isolated.build(task, BuildParams{{"n", int64_t{5}}});
    EXPECT_EQ(seen, 5);
}
