//
//  ChildProcess.cpp
//  devagentd
//
//  Created on 17.10.26.
//

#include "ChildProcess.hpp"
#include "../DAException.hpp"

#include <libgeneral/macros.h>

#include <thread>

#include <sys/wait.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>

#define POLL_INTERVAL_MS 50
#define MAX_CHILD_FD 1024

#pragma mark ChildProcess
ChildProcess::ChildProcess(const LaunchInfo &info, LineHandler lineHandler)
: _pid(-1), _reaped(false), _exitCode(-1)
, _outfd(-1), _errfd(-1)
, _wakePipe{-1,-1}
, _lineHandler(lineHandler)
{
    bool capture = (bool)_lineHandler;
    if (capture) {
        assure(!pipe2(_wakePipe, O_CLOEXEC));
    }
    try {
        spawn(info, capture);
        if (capture) startLoop();
    } catch (tihmstar::exception &e) {
        if (_pid > 0) killTree();
        safeClose(_outfd);
        safeClose(_errfd);
        safeClose(_wakePipe[0]);
        safeClose(_wakePipe[1]);
        throw;
    }
}

ChildProcess::~ChildProcess(){
    if (!reap(false)) {
        debug("[ChildProcess] pid %d still alive on destruction, killing",_pid);
        killTree();
    }
    stopLoop();
    safeClose(_outfd);
    safeClose(_errfd);
    safeClose(_wakePipe[0]);
    safeClose(_wakePipe[1]);
}

void ChildProcess::spawn(const LaunchInfo &info, bool capture){
    int outPipe[2] = {-1,-1};
    int errPipe[2] = {-1,-1};
    int execPipe[2] = {-1,-1};
    cleanup([&]{
        safeClose(outPipe[0]);
        safeClose(outPipe[1]);
        safeClose(errPipe[0]);
        safeClose(errPipe[1]);
        safeClose(execPipe[0]);
        safeClose(execPipe[1]);
    });
    std::vector<std::string> argStrs;
    std::vector<std::string> envStrs;
    std::vector<char*> argv;
    std::vector<char*> envp;

    if (info.executable.empty()) {
        retcustomerror(DAException_launch_failed, "no executable given");
    }

    //everything the child needs is prepared before fork
    argStrs.push_back(info.executable);
    argStrs.insert(argStrs.end(), info.arguments.begin(), info.arguments.end());
    for (auto &s : argStrs) argv.push_back(s.data());
    argv.push_back(nullptr);

    for (char **e = environ; e && *e; e++) {
        std::string kv = *e;
        std::string key = kv.substr(0, kv.find('='));
        if (info.environment.find(key) == info.environment.end()) envStrs.push_back(kv);
    }
    for (auto &kv : info.environment) envStrs.push_back(kv.first + "=" + kv.second);
    for (auto &s : envStrs) envp.push_back(s.data());
    envp.push_back(nullptr);

    if (capture) {
        assure(!pipe2(outPipe, O_CLOEXEC));
        assure(!pipe2(errPipe, O_CLOEXEC));
    }
    assure(!pipe2(execPipe, O_CLOEXEC));

    retassure((_pid = fork()) != -1, "fork() failed: %s", strerror(errno));

    if (_pid == 0) {
        //child, only async-signal-safe calls from here on
        int childErr = 0;
        int nullfd = -1;
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        nullfd = open("/dev/null", O_RDWR);
        if (nullfd >= 0) dup2(nullfd, STDIN_FILENO);
        if (capture) {
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);
        } else if (nullfd >= 0) {
            dup2(nullfd, STDOUT_FILENO);
            dup2(nullfd, STDERR_FILENO);
        }

        if (info.workingDirectory.size() && chdir(info.workingDirectory.c_str()) != 0) {
            childErr = errno;
            if (write(execPipe[1], &childErr, sizeof(childErr))) {}
            _exit(127);
        }

        for (int i = 3; i < MAX_CHILD_FD; i++) {
            if (i != execPipe[1]) close(i);
        }

        execvpe(argv[0], argv.data(), envp.data());

        childErr = errno;
        if (write(execPipe[1], &childErr, sizeof(childErr))) {}
        _exit(127);
    }

    setpgid(_pid, _pid);
    safeClose(execPipe[1]);
    safeClose(outPipe[1]);
    safeClose(errPipe[1]);

    {
        int childErr = 0;
        ssize_t didRead = 0;
        while ((didRead = read(execPipe[0], &childErr, sizeof(childErr))) == -1 && errno == EINTR);
        if (didRead == sizeof(childErr)) {
            int status = 0;
            waitpid(_pid, &status, 0);
            _pid = -1;
            retcustomerror(DAException_launch_failed, "failed to launch '%s' (cwd='%s'): %s",
                           info.executable.c_str(), info.workingDirectory.c_str(), strerror(childErr));
        }
    }

    if (capture) {
        _outfd = outPipe[0]; outPipe[0] = -1;
        _errfd = errPipe[0]; errPipe[0] = -1;
    }
    debug("[ChildProcess] launched '%s' as pid %d",info.executable.c_str(),_pid);
}

bool ChildProcess::reap(bool block) noexcept{
    std::unique_lock<std::mutex> ul(_statusLck);
    int status = 0;
    pid_t res = 0;
    if (_reaped || _pid <= 0) return true;

    while ((res = waitpid(_pid, &status, block ? 0 : WNOHANG)) == -1 && errno == EINTR);
    if (res == _pid) {
        _reaped = true;
        if (WIFEXITED(status)) {
            _exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            _exitCode = 128 + WTERMSIG(status);
        }
        return true;
    }
    if (res == -1) {
        //someone else reaped it
        _reaped = true;
        return true;
    }
    return false;
}

bool ChildProcess::isRunning() noexcept{
    return !reap(false);
}

std::optional<int> ChildProcess::exitCode() noexcept{
    if (!reap(false)) return std::nullopt;
    std::unique_lock<std::mutex> ul(_statusLck);
    return _exitCode;
}

bool ChildProcess::waitForExit(std::chrono::milliseconds timeout) noexcept{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
    }
    return true;
}

bool ChildProcess::killTree(std::chrono::milliseconds timeout) noexcept{
    if (reap(false)) return true;
    if (kill(-_pid, SIGKILL) == -1) {
        //group may not exist if setpgid lost the race
        kill(_pid, SIGKILL);
    }
    if (!waitForExit(timeout)) {
        warning("[ChildProcess] pid %d did not exit within %lld ms after SIGKILL",_pid,(long long)timeout.count());
        return false;
    }
    return true;
}

#pragma mark output pump
bool ChildProcess::loopEvent(){
    struct pollfd pfd[3] = {
        {
            .fd = _outfd,
            .events = POLLIN
        },
        {
            .fd = _errfd,
            .events = POLLIN
        },
        {
            .fd = _wakePipe[0],
            .events = POLLIN
        }
    };
    if (_outfd < 0 && _errfd < 0) return false;

    if (poll(pfd, 3, -1) == -1) {
        retassure(errno == EINTR, "[ChildProcess] poll failed errno=%d (%s)",errno,strerror(errno));
        return true;
    }
    if (pfd[2].revents) {
        //graceful kill requested
        return false;
    }

    for (int i = 0; i < 2; i++) {
        int &fd = (i == 0) ? _outfd : _errfd;
        std::string &buf = (i == 0) ? _outBuf : _errBuf;
        if (fd < 0 || !(pfd[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        char rbuf[4096];
        ssize_t didRead = read(fd, rbuf, sizeof(rbuf));
        if (didRead > 0) {
            buf.append(rbuf, didRead);
            flushLines(buf, i == 1, false);
        } else if (didRead == 0 || (errno != EINTR && errno != EAGAIN)) {
            flushLines(buf, i == 1, true);
            safeClose(fd);
        }
    }
    return _outfd >= 0 || _errfd >= 0;
}

void ChildProcess::stopAction() noexcept{
    safeClose(_wakePipe[1]);
}

void ChildProcess::afterLoop() noexcept{
    flushLines(_outBuf, false, true);
    flushLines(_errBuf, true, true);
}

void ChildProcess::flushLines(std::string &buf, bool isStderr, bool final) noexcept{
    size_t pos = 0;
    while ((pos = buf.find('\n')) != std::string::npos || (final && buf.size())) {
        std::string line = (pos == std::string::npos) ? buf : buf.substr(0, pos);
        buf.erase(0, (pos == std::string::npos) ? buf.size() : pos + 1);
        if (line.size() && line.back() == '\r') line.pop_back();
        if (line.empty() || !_lineHandler) continue;
        try {
            _lineHandler(line, isStderr);
        } catch (tihmstar::exception &e) {
            error("[ChildProcess] line handler failed with error=%d (%s)",e.code(),e.what());
        } catch (std::exception &e) {
            error("[ChildProcess] line handler failed (%s)",e.what());
        }
    }
}

#pragma mark static
std::optional<int> ChildProcess::runWithTimeout(const LaunchInfo &info, std::chrono::milliseconds timeout){
    ChildProcess proc(info);
    if (!proc.waitForExit(timeout)) {
        debug("[ChildProcess] '%s' timed out after %lld ms, killing",info.executable.c_str(),(long long)timeout.count());
        proc.killTree();
        return std::nullopt;
    }
    return proc.exitCode();
}
