#include "StreamForwarder.hpp"
#include "Logger.hpp"

#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <utility>

// EPIPE вместо SIGPIPE, если наш stdout/stderr закрыли
static void blockSigpipe() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

StreamForwarder::StreamForwarder(int outSink, int errSink, CrashDetector detector)
  : outSink_(outSink)
  , errSink_(errSink)
  , detector_(std::move(detector))
{}

StreamForwarder::~StreamForwarder() {
    join();
}

void StreamForwarder::start(int childOut, int childErr) {
    outThread_ = std::thread(&StreamForwarder::pumpStdout, this, childOut);
    errThread_ = std::thread(&StreamForwarder::pumpStderr, this, childErr);
}

void StreamForwarder::join() {
    if (outThread_.joinable())
        outThread_.join();
    if (errThread_.joinable())
        errThread_.join();
}

std::optional<std::string> StreamForwarder::takeCapture() {
    return detector_.takeCapture();
}

std::string StreamForwarder::error() const {
    std::lock_guard<std::mutex> lk(errorMutex_);
    return error_;
}

void StreamForwarder::recordError(const std::string& msg) {
    Logger::error("StreamForwarder: %s", msg.c_str());
    std::lock_guard<std::mutex> lk(errorMutex_);
    if (error_.empty())
        error_ = msg;
}

bool StreamForwarder::writeAll(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len  -= size_t(n);
    }
    return true;
}

void StreamForwarder::emit(int fd, const std::string& data, bool& broken, const char* stream) {
    if (data.empty() || broken)
        return;
    if (!writeAll(fd, data.data(), data.size())) {
        // дальше продолжаем вычитывать канал, чтобы ребёнок не встал на записи
        broken = true;
        recordError(std::string("write to ") + stream + " failed: " + std::strerror(errno));
    }
}

void StreamForwarder::pumpStdout(int fd) {
    blockSigpipe();
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            recordError(std::string("read from child stdout failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) break;
        emit(outSink_, std::string(buf, size_t(n)), outBroken_, "stdout");
    }
    ::close(fd);
    Logger::debug("StreamForwarder: child stdout closed");
}

int StreamForwarder::pollTimeout(std::optional<CrashDetector::TimePoint> deadline,
                                 CrashDetector::TimePoint now) {
    using namespace std::chrono;
    if (!deadline)
        return -1;
    if (*deadline <= now)
        return 0;
    auto left = ceil<milliseconds>(*deadline - now).count();
    // отрицательное значение poll() понял бы как "ждать вечно"
    return left > INT_MAX ? INT_MAX : int(left);
}

void StreamForwarder::pumpStderr(int fd) {
    blockSigpipe();
    char buf[8192];
    for (;;) {
        int timeout = pollTimeout(detector_.nextDeadline(), CrashDetector::Clock::now());

        pollfd p { fd, POLLIN, 0 };
        int rc = ::poll(&p, 1, timeout);
        if (rc < 0) {
            if (errno == EINTR) continue;
            recordError(std::string("poll on child stderr failed: ") + std::strerror(errno));
            break;
        }
        if (rc == 0) {
            emit(errSink_, detector_.tick(CrashDetector::Clock::now()), errBroken_, "stderr");
            continue;
        }

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            recordError(std::string("read from child stderr failed: ") + std::strerror(errno));
            break;
        }
        if (n == 0) break;
        emit(errSink_, detector_.feed(buf, size_t(n), CrashDetector::Clock::now()), errBroken_, "stderr");
    }
    emit(errSink_, detector_.finish(), errBroken_, "stderr");
    ::close(fd);
    Logger::debug("StreamForwarder: child stderr closed, captured %zu bytes", detector_.capturedBytes());
}
