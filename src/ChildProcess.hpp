#pragma once
#include <string>
#include <vector>
#include <sys/types.h>

struct SpawnedChild {
    pid_t pid   = -1;
    int   outFd = -1;   // читающий конец stdout ребёнка
    int   errFd = -1;   // читающий конец stderr ребёнка
};

class ChildProcess {
public:
    // /proc/self/exe
    static bool selfExecutable(std::string& path, std::string& err);
    // /proc/self/cmdline, argv[0] включительно
    static bool selfArguments(std::vector<std::string>& args, std::string& err);

    // posix_spawn: stdin наследуется, stdout/stderr в пайпы.
    // В ребёнке пустая маска сигналов и SIG_DFL для defaultSignals.
    static bool spawn(const std::string& exe,
                      const std::vector<std::string>& args,
                      const std::vector<std::string>& env,
                      const std::vector<int>& defaultSignals,
                      SpawnedChild& child,
                      std::string& err);

    // Ждёт завершения, но не забирает зомби: pid не может быть переиспользован
    static bool waitExited(pid_t pid, std::string& err);

    static bool wait(pid_t pid, int& exitStatus, std::string& err);

    // Код выхода как есть, смерть от сигнала N -> 128+N, прочее -> -1
    static int exitStatusFromWait(int status);
};
