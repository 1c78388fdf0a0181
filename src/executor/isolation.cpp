/**
 * @file isolation.cpp
 * @brief Process and thread workers, and the isolation policy.
 */

#include "executor/isolation.hpp"

#include "core/errors.hpp"
#include "executor/worker_codec.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace dagbuild {

namespace {

constexpr int kExitResponseSent = 0;
constexpr int kExitWriteFailed = 3;

bool write_all(int fd, const std::vector<uint8_t>& data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

// Reads until one complete frame has arrived or the write end is closed.
std::vector<uint8_t> read_response(int fd) {
    std::vector<uint8_t> out;
    uint8_t chunk[4096];
    for (;;) {
        const auto expected = WorkerCodec::frame_size(out);
        if (expected && out.size() >= *expected) break;
        const ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(),
                                    "reading isolated worker response");
        }
        out.insert(out.end(), chunk, chunk + n);
    }
    return out;
}

void flush_standard_streams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
}

}  // namespace

// ─────────────────────────────────────────────
// ProcessWorker
// ─────────────────────────────────────────────

ProcessWorker::ProcessWorker(std::function<void()> flush_output)
    : flush_output_(std::move(flush_output)) {}

ProcessWorker::~ProcessWorker() {
    release();
}

void ProcessWorker::release() noexcept {
    if (read_fd_ >= 0) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        pid_ = -1;
    }
}

void ProcessWorker::child_main(int write_fd, const BuildCall& call,
                               const std::function<void()>& flush_output) {
    std::optional<TaskReport> report;
    std::string trace;
    try {
        report = call();
    } catch (...) {
        // Shipped to the parent, which re-throws it.
        trace = describe_exception(std::current_exception());
    }

    // Output the call produced lives in this process's buffers only.
    try {
        if (flush_output) flush_output();
        flush_standard_streams();
    } catch (...) {
        if (!trace.empty()) trace += "\n";
        trace += "While flushing isolated worker output:\n"
                 + describe_exception(std::current_exception());
        report.reset();
    }

    const auto payload = report ? WorkerCodec::encode_success(*report)
                                : WorkerCodec::encode_failure(trace);
    const bool sent = write_all(write_fd, payload);
    ::close(write_fd);
    // _exit: the child must not run the parent's atexit handlers. Every
    // buffer it owns was flushed above.
    _exit(sent ? kExitResponseSent : kExitWriteFailed);
}

TaskReport ProcessWorker::run(const BuildCall& call) {
    int fds[2];
    // O_CLOEXEC keeps the write end out of programs the call executes, so a
    // lingering background process cannot hold the pipe open.
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "creating isolated worker pipe");
    }

    if (flush_output_) flush_output_();
    flush_standard_streams();

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::system_error(err, std::generic_category(), "forking isolated worker");
    }
    if (pid == 0) {
        ::close(fds[0]);
        child_main(fds[1], call, flush_output_);
    }

    pid_ = pid;
    read_fd_ = fds[0];
    ::close(fds[1]);

    const auto data = read_response(read_fd_);
    ::close(read_fd_);
    read_fd_ = -1;

    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waiting for isolated worker");
        }
    }
    const pid_t reaped = pid_;
    pid_ = -1;

    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        throw IsolatedBuildError("Isolated worker (pid " + std::to_string(reaped)
                                 + ") terminated by signal " + std::to_string(sig)
                                 + " (" + strsignal(sig) + ")");
    }

    auto response = WorkerCodec::decode(data);
    if (!response) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        throw IsolatedBuildError("Isolated worker (pid " + std::to_string(reaped)
                                 + ") exited with status " + std::to_string(code)
                                 + " without a valid response: " + response.error().message);
    }

    if (!response->success) {
        throw IsolatedBuildError(response->trace);
    }
    return std::move(response->report);
}

// ─────────────────────────────────────────────
// ThreadWorker
// ─────────────────────────────────────────────

TaskReport ThreadWorker::run(const BuildCall& call) {
    std::promise<TaskReport> promise;
    auto future = promise.get_future();

    {
        std::jthread worker([&promise, &call] {
            try {
                promise.set_value(call());
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
        });
    }  // joined here

    return future.get();
}

WorkerFactory make_worker_factory(IsolationBackend backend, Logger* logger) {
    switch (backend) {
        case IsolationBackend::Thread:
            return [] { return std::make_unique<ThreadWorker>(); };
        case IsolationBackend::Process:
            break;
    }
    return [logger] {
        std::function<void()> flush_output;
        if (logger) flush_output = [logger] { logger->flush(); };
        return std::make_unique<ProcessWorker>(std::move(flush_output));
    };
}

// ─────────────────────────────────────────────
// IsolationStrategy
// ─────────────────────────────────────────────

IsolationStrategy::IsolationStrategy(bool enabled, WorkerFactory factory)
    : enabled_(enabled), factory_(std::move(factory)) {}

bool IsolationStrategy::applies_to(const Task& task) const noexcept {
    return enabled_ && task.source_kind() == SourceKind::InMemoryCallable;
}

TaskReport IsolationStrategy::build(Task& task, const BuildParams& params) {
    if (!applies_to(task)) {
        return task.build(params);
    }

    if (!factory_) {
        throw std::logic_error("IsolationStrategy has no worker factory");
    }
    auto worker = factory_();
    ++workers_spawned_;
    return worker->run([&task, &params] { return task.build(params); });
}

}  // namespace dagbuild
