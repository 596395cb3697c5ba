#ifndef CRASHREPORTER_HPP
#define CRASHREPORTER_HPP

#include <string>
#include "CommonTypes.hpp"

// Готовый обработчик: сохраняет дамп в каталог и/или отправляет POST-ом.
class CrashReporter {
public:
    // Пустые url / crashDir выключают соответствующую часть
    CrashReporter(const std::string& url, const std::string& crashDir);
    ~CrashReporter();

    // hex SHA-256 текста дампа
    static std::string fingerprint(const std::string& capture);

    // Пишет <crashDir>/crash-<fingerprint>.txt, путь в path
    bool saveToDir(const std::string& capture, std::string& path);

    // POST text/plain c X-Crash-Fingerprint, true при HTTP 2xx
    bool submit(const std::string& capture, long& httpCode);

    // Обработчик для WrapConfig::handler. CrashReporter должен пережить wrap().
    CrashHandler handler();

    const std::string& lastSavedPath() const { return lastSavedPath_; }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);

private:
    std::string url_;
    std::string crashDir_;
    std::string lastSavedPath_;
};

#endif // CRASHREPORTER_HPP
