#include "Logger.hpp"
#include <cstdlib>
#include <cstring>

Logger::Level Logger::s_level = Logger::Level::Warn;
FILE*         Logger::s_file  = nullptr;
std::mutex    Logger::s_mutex;

void Logger::init(Level lvl) {
    s_level = lvl;
}

void Logger::initFromEnv(const char* var) {
    const char* v = std::getenv(var);
    if (!v) return;
    if      (std::strcmp(v, "error") == 0) s_level = Level::Error;
    else if (std::strcmp(v, "warn")  == 0) s_level = Level::Warn;
    else if (std::strcmp(v, "info")  == 0) s_level = Level::Info;
    else if (std::strcmp(v, "debug") == 0) s_level = Level::Debug;
}

void Logger::setFile(FILE* fp) {
    std::lock_guard<std::mutex> lk(s_mutex);
    s_file = fp;
}

bool Logger::isDebug() {
    return s_level == Level::Debug;
}

void Logger::error(const char* fmt, ...) {
    if (s_level < Level::Error) return;
    va_list ap; va_start(ap, fmt);
    log(Level::Error, fmt, ap);
    va_end(ap);
}

void Logger::warn(const char* fmt, ...) {
    if (s_level < Level::Warn) return;
    va_list ap; va_start(ap, fmt);
    log(Level::Warn, fmt, ap);
    va_end(ap);
}

void Logger::info(const char* fmt, ...) {
    if (s_level < Level::Info) return;
    va_list ap; va_start(ap, fmt);
    log(Level::Info, fmt, ap);
    va_end(ap);
}

void Logger::debug(const char* fmt, ...) {
    if (s_level < Level::Debug) return;
    va_list ap; va_start(ap, fmt);
    log(Level::Debug, fmt, ap);
    va_end(ap);
}

void Logger::log(Level lvl, const char* fmt, va_list ap) {
    static const char* names[] = { "ERROR","WARN","INFO","DEBUG" };
    std::lock_guard<std::mutex> lk(s_mutex);
    FILE* out = s_file ? s_file : stderr;
    std::fprintf(out, "[crashwrap][%s] ", names[int(lvl)]);
    std::vfprintf(out, fmt, ap);
    std::fprintf(out, "\n");
    std::fflush(out);
}
