//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/exec with stdio pipes, Boost.Asio stream_descriptor readers and waitpid polling
//==========================================================================================================

#include "mcprt/ChildProcess.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"

extern char** environ;

namespace mcprt {

namespace {
constexpr std::chrono::milliseconds kExitPollInterval{50};

std::string errnoText(int err) {
    return std::strerror(err);
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<std::string> mergedEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) merged[k] = v;
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
    return out;
}

std::vector<char*> pointers(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}
} // namespace

std::string describeExit(const ExitStatus& status) {
    if (status.code) return "code " + std::to_string(*status.code);
    if (status.signal) return "signal " + std::to_string(*status.signal);
    return "unknown status";
}

ChildProcess::ChildProcess(EventLoop& l, Handlers h)
    : loop(l), handlers(std::move(h)), stdinPipe(l.Context()), stdoutPipe(l.Context()),
      stderrPipe(l.Context()), exitPoll(l.Context()) {}

ChildProcess::~ChildProcess() {
    if (alive.load() && pid > 0) {
        // Never reaped (loop torn down first); make sure the child does not outlive us.
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
    }
}

std::shared_ptr<ChildProcess> ChildProcess::Spawn(EventLoop& loop, const ProcessSpec& spec, Handlers handlers) {
    FUNC_SCOPE();
    if (spec.command.empty()) {
        throw errors::ProcessError("Missing command");
    }

    // Writing to a child that already exited must surface as EPIPE, not kill the host.
    static std::once_flag sigpipeOnce;
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });

    std::vector<std::string> argStore;
    argStore.push_back(spec.command);
    argStore.insert(argStore.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> envStore = mergedEnvironment(spec.env);
    std::vector<char*> argv = pointers(argStore);
    std::vector<char*> envp = pointers(envStore);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw errors::ProcessError("Failed to create pipes: " + errnoText(err));
    }

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        closeAll();
        throw errors::ProcessError("Failed to fork: " + errnoText(err));
    }
    if (child == 0) {
        // dup2 clears FD_CLOEXEC on the targets; every other pipe end closes on exec.
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!::write(execPipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);
    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        ::waitpid(child, nullptr, 0);
        closeAll();
        throw errors::ProcessError("Failed to spawn '" + spec.command + "': " + errnoText(execErr));
    }

    std::shared_ptr<ChildProcess> proc(new ChildProcess(loop, std::move(handlers)));
    proc->pid = child;
    proc->stdinPipe.assign(inPipe[1]);
    proc->stdoutPipe.assign(outPipe[0]);
    proc->stderrPipe.assign(errPipe[0]);
    LOG_DEBUG("Spawned '{}' pid={}", spec.command, child);

    loop.Post([proc]() {
        proc->readFrom(proc->stdoutPipe, proc->stdoutBuffer, true);
        proc->readFrom(proc->stderrPipe, proc->stderrBuffer, false);
        proc->pollExit();
    });
    return proc;
}

void ChildProcess::readFrom(net::posix::stream_descriptor& stream, std::array<char, 4096>& buffer, bool isStdout) {
    if (!stream.is_open()) return;
    auto self = shared_from_this();
    stream.async_read_some(net::buffer(buffer),
        [self, &stream, &buffer, isStdout](const boost::system::error_code& ec, std::size_t bytes) {
            if (bytes > 0) {
                const auto& handler = isStdout ? self->handlers.onStdout : self->handlers.onStderr;
                if (handler) handler(std::string(buffer.data(), bytes));
            }
            if (ec) {
                if (ec != net::error::eof && ec != net::error::operation_aborted) {
                    LOG_DEBUG("pid {} {} read ended: {}", self->pid, isStdout ? "stdout" : "stderr", ec.message());
                }
                return;
            }
            self->readFrom(stream, buffer, isStdout);
        });
}

void ChildProcess::pollExit() {
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid && (WIFEXITED(status) || WIFSIGNALED(status))) {
        ExitStatus st;
        if (WIFEXITED(status)) {
            st.code = WEXITSTATUS(status);
        } else {
            st.signal = WTERMSIG(status);
        }
        alive = false;
        LOG_DEBUG("pid {} exited with {}", pid, describeExit(st));
        if (handlers.onExit) handlers.onExit(st);
        return;
    }
    if (r < 0 && errno != EINTR) {
        LOG_ERROR("waitpid({}) failed: {}", pid, errnoText(errno));
        alive = false;
        if (handlers.onExit) handlers.onExit(ExitStatus{});
        return;
    }
    auto self = shared_from_this();
    exitPoll.expires_after(kExitPollInterval);
    exitPoll.async_wait([self](const boost::system::error_code& ec) {
        if (ec) return;
        self->pollExit();
    });
}

void ChildProcess::Kill(int signal) {
    if (!alive.load()) return;
    if (::kill(pid, signal) != 0 && errno != ESRCH) {
        throw errors::ProcessError("Failed to send signal " + std::to_string(signal) + " to pid " +
                                   std::to_string(pid) + ": " + errnoText(errno));
    }
}

std::future<void> ChildProcess::Write(const std::string& data) {
    auto pending = std::make_shared<PendingWrite>();
    pending->data = data;
    auto fut = pending->done.get_future();
    auto self = shared_from_this();
    loop.Post([self, pending]() {
        if (!self->stdinPipe.is_open()) {
            pending->done.set_exception(std::make_exception_ptr(
                errors::ProcessError("stdin of pid " + std::to_string(self->pid) + " is closed")));
            return;
        }
        self->writeQueue.push_back(std::move(*pending));
        if (!self->writing) self->writeNext();
    });
    return fut;
}

void ChildProcess::writeNext() {
    if (writeQueue.empty()) {
        writing = false;
        return;
    }
    writing = true;
    auto self = shared_from_this();
    net::async_write(stdinPipe, net::buffer(writeQueue.front().data),
        [self](const boost::system::error_code& ec, std::size_t) {
            if (self->writeQueue.empty()) {
                self->writing = false;
                return;
            }
            PendingWrite done = std::move(self->writeQueue.front());
            self->writeQueue.pop_front();
            if (ec) {
                done.done.set_exception(std::make_exception_ptr(errors::ProcessError(
                    "Write to pid " + std::to_string(self->pid) + " failed: " + ec.message())));
            } else {
                done.done.set_value();
            }
            self->writeNext();
        });
}

void ChildProcess::Close() {
    auto self = shared_from_this();
    loop.Post([self]() {
        boost::system::error_code ignored;
        self->stdinPipe.close(ignored);
        self->stdoutPipe.close(ignored);
        self->stderrPipe.close(ignored);
    });
}

} // namespace mcprt
