#include "ChildProcess.hpp"
#include "Logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fstream>
#include <iterator>

bool ChildProcess::selfExecutable(std::string& path, std::string& err) {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n < 0) {
        err = std::string("readlink /proc/self/exe: ") + std::strerror(errno);
        return false;
    }
    path.assign(buf, size_t(n));
    return true;
}

bool ChildProcess::selfArguments(std::vector<std::string>& args, std::string& err) {
    std::ifstream in("/proc/self/cmdline", std::ios::binary);
    if (!in) {
        err = "cannot open /proc/self/cmdline";
        return false;
    }
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    args.clear();
    size_t start = 0, p;
    while ((p = raw.find('\0', start)) != std::string::npos) {
        args.push_back(raw.substr(start, p - start));
        start = p + 1;
    }
    if (start < raw.size())
        args.push_back(raw.substr(start));

    if (args.empty()) {
        err = "/proc/self/cmdline is empty";
        return false;
    }
    return true;
}

static std::vector<char*> toArgv(const std::vector<std::string>& v) {
    std::vector<char*> out;
    out.reserve(v.size() + 1);
    for (auto& s : v)
        out.push_back(const_cast<char*>(s.c_str()));
    out.push_back(nullptr);
    return out;
}

bool ChildProcess::spawn(const std::string& exe,
                         const std::vector<std::string>& args,
                         const std::vector<std::string>& env,
                         const std::vector<int>& defaultSignals,
                         SpawnedChild& child,
                         std::string& err) {
    int outPipe[2], errPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) != 0) {
        err = std::string("pipe2: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        err = std::string("pipe2: ") + std::strerror(errno);
        ::close(outPipe[0]); ::close(outPipe[1]);
        return false;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, outPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, errPipe[1], STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t mask, defaults;
    sigemptyset(&mask);
    sigemptyset(&defaults);
    for (int sig : defaultSignals)
        sigaddset(&defaults, sig);
    posix_spawnattr_setsigmask(&attr, &mask);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

    auto argv = toArgv(args);
    auto envp = toArgv(env);

    pid_t pid = -1;
    int rc = ::posix_spawn(&pid, exe.c_str(), &actions, &attr, argv.data(), envp.data());

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    if (rc != 0) {
        err = "posix_spawn " + exe + ": " + std::strerror(rc);
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        return false;
    }

    child.pid   = pid;
    child.outFd = outPipe[0];
    child.errFd = errPipe[0];
    return true;
}

bool ChildProcess::waitExited(pid_t pid, std::string& err) {
    for (;;) {
        siginfo_t info {};
        if (::waitid(P_PID, id_t(pid), &info, WEXITED | WNOWAIT) == 0)
            return true;
        if (errno == EINTR) continue;
        err = std::string("waitid: ") + std::strerror(errno);
        return false;
    }
}

bool ChildProcess::wait(pid_t pid, int& exitStatus, std::string& err) {
    int status = 0;
    for (;;) {
        pid_t r = ::waitpid(pid, &status, 0);
        if (r == pid) break;
        if (r < 0 && errno == EINTR) continue;
        err = std::string("waitpid: ") + std::strerror(errno);
        return false;
    }

    exitStatus = exitStatusFromWait(status);
    if (WIFSIGNALED(status))
        Logger::debug("ChildProcess: pid %d killed by signal %d", (int)pid, WTERMSIG(status));
    else
        Logger::debug("ChildProcess: pid %d exited with %d", (int)pid, exitStatus);
    return true;
}

int ChildProcess::exitStatusFromWait(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}
