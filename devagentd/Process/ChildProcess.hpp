//
//  ChildProcess.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef ChildProcess_hpp
#define ChildProcess_hpp

#include <libgeneral/Manager.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

/*
 One external child process in its own process group.
 stdout/stderr are pumped line by line to a handler on the Manager thread.
 */
class ChildProcess : public tihmstar::Manager{
public:
    struct LaunchInfo{
        std::string executable;
        std::vector<std::string> arguments;
        std::string workingDirectory;
        std::map<std::string,std::string> environment;
    };
    using LineHandler = std::function<void(const std::string &line, bool isStderr)>;

private:
    pid_t _pid;
    std::mutex _statusLck;
    bool _reaped;
    int _exitCode;
    int _outfd;
    int _errfd;
    int _wakePipe[2];
    LineHandler _lineHandler;
    std::string _outBuf;
    std::string _errBuf;

    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;
    virtual void afterLoop() noexcept override;

    void spawn(const LaunchInfo &info, bool capture);
    bool reap(bool block) noexcept;
    void flushLines(std::string &buf, bool isStderr, bool final) noexcept;

public:
    /*
     Spawns immediately.
     Throws DAException_launch_failed if the executable can't be started
     */
    ChildProcess(const LaunchInfo &info, LineHandler lineHandler = nullptr);
    virtual ~ChildProcess() override;

    pid_t pid() const noexcept {return _pid;}
    bool isRunning() noexcept;
    std::optional<int> exitCode() noexcept;

    /*
     Polls for exit until timeout expires.
     Returns true if the child has exited
     */
    bool waitForExit(std::chrono::milliseconds timeout) noexcept;

    /*
     SIGKILLs the whole process group and waits for the leader at most timeout.
     Returns true if the leader was reaped
     */
    bool killTree(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) noexcept;

    /*
     Runs a command to completion, killing it when timeout expires.
     Returns the exit code, or nothing on timeout
     */
    static std::optional<int> runWithTimeout(const LaunchInfo &info, std::chrono::milliseconds timeout);
};

#endif /* ChildProcess_hpp */
