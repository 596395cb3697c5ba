// CommonTypes.hpp
#pragma once

#include <chrono>
#include <csignal>
#include <functional>
#include <string>
#include <vector>
#include <unistd.h>
#include "RelaunchToken.hpp"

// Получает полный текст перехваченного дампа
using CrashHandler = std::function<void(const std::string& capture)>;

enum class WrapRole { Supervisor, Payload };

enum class WrapError {
    None = 0,
    Config,   // не задан handler
    Spawn,    // не удалось запустить дочерний процесс
    Stream,   // ошибка ввода-вывода на одном из потоков
    Wait      // не удалось получить статус завершения
};

const char* wrapErrorName(WrapError e);

// Строки, с которых начинаются аварийные дампы C++ рантайма и glibc
std::vector<std::string> defaultSignatures();

struct WrapConfig {
    CrashHandler handler;

    // false: сырой дамп уходит в настоящий stderr перед вызовом handler
    bool hideCapture = false;

    std::vector<std::string> signatures = defaultSignatures();

    // Сколько ждать продолжения начатой сигнатуры. 0 = сбрасывать в конце каждого чтения
    std::chrono::milliseconds patience { 1000 };

    // Тишина после начала захвата, после которой захват фиксируется. 0 = до EOF
    std::chrono::milliseconds quietPeriod { 0 };

    // Пусто = /proc/self/exe и /proc/self/cmdline
    std::string              executable;
    std::vector<std::string> args;

    std::string tokenKey = RelaunchToken::kDefaultKey;

    std::vector<int> forwardSignals { SIGTERM, SIGHUP };
    std::vector<int> ignoreSignals  { SIGINT, SIGQUIT };

    int stdoutFd = STDOUT_FILENO;
    int stderrFd = STDERR_FILENO;

    bool installSignalHandlers = true;

    WrapConfig() = default;
    WrapConfig(const WrapConfig&) = default;
    WrapConfig& operator=(const WrapConfig&) = default;
    // Снимает отметку payload для этого экземпляра
    ~WrapConfig();
};

struct WrapResult {
    WrapRole    role = WrapRole::Supervisor;
    bool        done = false;
    int         exitStatus = 0;   // код выхода, 128+N для смерти от сигнала N, -1 если неизвестен
    WrapError   error = WrapError::None;
    std::string message;

    bool ok() const { return error == WrapError::None; }
};
