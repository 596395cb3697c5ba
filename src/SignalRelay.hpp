#pragma once
#include <atomic>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/types.h>

// Пока супервизор ждёт ребёнка: forward-сигналы пересылаются ребёнку,
// ignore-сигналы поглощаются. Работает через маску + sigtimedwait.
class SignalRelay {
public:
    SignalRelay(const std::vector<int>& forward, const std::vector<int>& ignore);
    ~SignalRelay();

    SignalRelay(const SignalRelay&) = delete;
    SignalRelay& operator=(const SignalRelay&) = delete;

    // Блокирует оба набора в текущем потоке. Звать до создания рабочих потоков,
    // они унаследуют маску.
    void block();
    void start(pid_t child);
    // Останавливает поток, выбирает зависшие сигналы, возвращает старую маску
    void stop();

    const std::vector<int>& handled() const { return all_; }

private:
    void loop();
    bool forwards(int sig) const;

    std::vector<int>  forward_;
    std::vector<int>  all_;
    sigset_t          set_;
    sigset_t          oldMask_;
    bool              blocked_ = false;
    pid_t             child_ = -1;
    std::atomic<bool> stop_ { false };
    std::thread       thread_;
};

// SIGPIPE заблокирован в текущем потоке на время жизни объекта: запись в
// закрытый пайп даёт EPIPE. SIGPIPE, пришедший за это время, выбирается
// в деструкторе, старая маска возвращается.
class SigpipeGuard {
public:
    SigpipeGuard();
    ~SigpipeGuard();

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t oldMask_;
    bool     wasPending_ = false;
    bool     blocked_ = false;
};
