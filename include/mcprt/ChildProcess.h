//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.h
// Purpose: POSIX child process with three pipes, asynchronous stdout/stderr reads and exit watching
//==========================================================================================================

#pragma once

#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "mcprt/EventLoop.h"

namespace mcprt {

struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    // Merged over the inherited environment; entries here win.
    std::map<std::string, std::string> env;
};

// Exactly one of code/signal is set for a normally reaped child.
struct ExitStatus {
    std::optional<int> code;
    std::optional<int> signal;
};

std::string describeExit(const ExitStatus& status);

//==========================================================================================================
// ChildProcess
// Purpose: Owns one spawned child. Output chunks and the exit status are delivered on the event loop
//          thread through the handlers given to Spawn(). The object keeps itself alive until the child
//          has been reaped.
//==========================================================================================================
class ChildProcess : public std::enable_shared_from_this<ChildProcess> {
public:
    struct Handlers {
        std::function<void(const std::string&)> onStdout;
        std::function<void(const std::string&)> onStderr;
        std::function<void(const ExitStatus&)> onExit;
    };

    //==========================================================================================================
    // Forks and execs spec.command.
    // Returns:
    //   Running child.
    // Throws:
    //   errors::ProcessError when pipes cannot be created, fork fails or exec fails (reported back
    //   through a close-on-exec pipe, so a missing binary fails here rather than as an exit).
    //==========================================================================================================
    static std::shared_ptr<ChildProcess> Spawn(EventLoop& loop, const ProcessSpec& spec, Handlers handlers);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid; }
    bool IsAlive() const { return alive.load(); }

    // Sends a signal. No-op once the child has been reaped. Throws errors::ProcessError on failure.
    void Kill(int signal);

    // Queues bytes for the child's stdin. The future fails with errors::ProcessError if the pipe is closed.
    std::future<void> Write(const std::string& data);

    // Closes all three pipes. The exit watch keeps running until the child is reaped.
    void Close();

private:
    struct PendingWrite {
        std::string data;
        std::promise<void> done;
    };

    ChildProcess(EventLoop& loop, Handlers handlers);

    void readFrom(net::posix::stream_descriptor& stream, std::array<char, 4096>& buffer, bool isStdout);
    void pollExit();
    void writeNext();

    EventLoop& loop;
    Handlers handlers;
    pid_t pid{-1};
    std::atomic<bool> alive{true};
    net::posix::stream_descriptor stdinPipe;
    net::posix::stream_descriptor stdoutPipe;
    net::posix::stream_descriptor stderrPipe;
    std::array<char, 4096> stdoutBuffer{};
    std::array<char, 4096> stderrBuffer{};
    net::steady_timer exitPoll;
    std::deque<PendingWrite> writeQueue;  // loop thread only
    bool writing{false};
};

} // namespace mcprt
