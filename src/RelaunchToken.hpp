#pragma once
#include <string>
#include <vector>

// Маркер "этот процесс - payload вызова wrap()" в окружении дочернего процесса
class RelaunchToken {
public:
    static constexpr const char* kDefaultKey = "CRASHWRAP_TOKEN";

    // Новое непрозрачное значение: hex SHA-256 от pid, времени и случайной соли
    static std::string generate();

    // Значение ключа на момент старта процесса (пусто если нет).
    // Окружение читается один раз на ключ, дальше только кеш.
    static std::string inherited(const std::string& key);

    static bool present(const std::string& key) { return !inherited(key).empty(); }

    // Текущее окружение + key=value (существующая запись key заменяется)
    static std::vector<std::string> childEnvironment(const std::string& key, const std::string& value);
};
