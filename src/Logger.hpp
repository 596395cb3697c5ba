#pragma once
#include <mutex>
#include <cstdarg>
#include <cstdio>

class Logger {
public:
    enum class Level { Error=0, Warn, Info, Debug };

    // Инициализируем единожды, до wrap()
    static void init(Level lvl);

    // Уровень из переменной окружения (error|warn|info|debug), иначе без изменений
    static void initFromEnv(const char* var);

    // nullptr = stderr
    static void setFile(FILE* fp);

    static bool isDebug();

    static void error(const char* fmt, ...);
    static void warn (const char* fmt, ...);
    static void info (const char* fmt, ...);
    static void debug(const char* fmt, ...);

private:
    static void log(Level lvl, const char* fmt, va_list ap);

    static Level      s_level;
    static FILE*      s_file;
    static std::mutex s_mutex;
};
