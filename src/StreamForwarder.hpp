#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "CrashDetector.hpp"

// Перекачивает stdout и stderr дочернего процесса в свои потоки.
// Каждый поток качается своим std::thread, порядок между ними не сохраняется.
// stderr проходит через CrashDetector.
class StreamForwarder {
public:
    StreamForwarder(int outSink, int errSink, CrashDetector detector);
    ~StreamForwarder();

    StreamForwarder(const StreamForwarder&) = delete;
    StreamForwarder& operator=(const StreamForwarder&) = delete;

    // Забирает владение дескрипторами (закрываются на EOF)
    void start(int childOut, int childErr);
    // Ждёт EOF на обоих потоках
    void join();

    // После join(): зафиксированный захват, если был
    std::optional<std::string> takeCapture();

    // Первая ошибка ввода-вывода, пусто если не было
    std::string error() const;

    // Таймаут poll() до дедлайна детектора: -1 без дедлайна, не больше INT_MAX
    static int pollTimeout(std::optional<CrashDetector::TimePoint> deadline,
                           CrashDetector::TimePoint now);

    // write() до конца с повтором на EINTR
    static bool writeAll(int fd, const char* data, size_t len);

private:
    void pumpStdout(int fd);
    void pumpStderr(int fd);
    void emit(int fd, const std::string& data, bool& broken, const char* stream);
    void recordError(const std::string& msg);

    int outSink_;
    int errSink_;
    CrashDetector detector_;   // трогает только stderr-поток до join()

    std::thread outThread_;
    std::thread errThread_;

    mutable std::mutex errorMutex_;
    std::string        error_;
    bool               outBroken_ = false;
    bool               errBroken_ = false;
};
