#include "SignalRelay.hpp"
#include "Logger.hpp"

#include <pthread.h>
#include <cerrno>
#include <ctime>
#include <algorithm>

SignalRelay::SignalRelay(const std::vector<int>& forward, const std::vector<int>& ignore)
  : forward_(forward)
{
    sigemptyset(&set_);
    sigemptyset(&oldMask_);
    for (int sig : forward) {
        sigaddset(&set_, sig);
        all_.push_back(sig);
    }
    for (int sig : ignore) {
        sigaddset(&set_, sig);
        all_.push_back(sig);
    }
}

SignalRelay::~SignalRelay() {
    stop();
}

bool SignalRelay::forwards(int sig) const {
    return std::find(forward_.begin(), forward_.end(), sig) != forward_.end();
}

void SignalRelay::block() {
    if (blocked_ || all_.empty()) return;
    if (pthread_sigmask(SIG_BLOCK, &set_, &oldMask_) != 0) {
        Logger::warn("SignalRelay: pthread_sigmask failed, signals are not relayed");
        return;
    }
    blocked_ = true;
}

void SignalRelay::start(pid_t child) {
    if (!blocked_) return;
    child_ = child;
    stop_ = false;
    thread_ = std::thread(&SignalRelay::loop, this);
}

void SignalRelay::loop() {
    const timespec step { 0, 100 * 1000 * 1000 };
    while (!stop_.load()) {
        siginfo_t info;
        int sig = ::sigtimedwait(&set_, &info, &step);
        if (sig < 0) continue;   // EAGAIN / EINTR
        if (forwards(sig)) {
            Logger::debug("SignalRelay: forwarding signal %d to pid %d", sig, (int)child_);
            if (::kill(child_, sig) != 0)
                Logger::warn("SignalRelay: kill(%d, %d) failed", (int)child_, sig);
        } else {
            Logger::debug("SignalRelay: ignoring signal %d", sig);
        }
    }
}

void SignalRelay::stop() {
    stop_ = true;
    if (thread_.joinable())
        thread_.join();
    if (!blocked_) return;

    // ребёнок уже завершён, всё что пришло после - не нам
    const timespec zero { 0, 0 };
    while (::sigtimedwait(&set_, nullptr, &zero) > 0) {}

    pthread_sigmask(SIG_SETMASK, &oldMask_, nullptr);
    blocked_ = false;
}

SigpipeGuard::SigpipeGuard() {
    sigset_t pipeSet;
    sigemptyset(&pipeSet);
    sigaddset(&pipeSet, SIGPIPE);
    sigemptyset(&oldMask_);

    // чужой уже висящий SIGPIPE не трогаем
    sigset_t pending;
    if (::sigpending(&pending) == 0)
        wasPending_ = sigismember(&pending, SIGPIPE) == 1;

    if (pthread_sigmask(SIG_BLOCK, &pipeSet, &oldMask_) != 0) {
        Logger::warn("SigpipeGuard: pthread_sigmask failed");
        return;
    }
    blocked_ = true;
}

SigpipeGuard::~SigpipeGuard() {
    if (!blocked_) return;
    if (!wasPending_) {
        sigset_t pipeSet;
        sigemptyset(&pipeSet);
        sigaddset(&pipeSet, SIGPIPE);
        const timespec zero { 0, 0 };
        while (::sigtimedwait(&pipeSet, nullptr, &zero) > 0) {}
    }
    pthread_sigmask(SIG_SETMASK, &oldMask_, nullptr);
}
