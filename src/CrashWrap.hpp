#pragma once

#include "CommonTypes.hpp"

// Вызывается один раз в начале main().
//
// Без токена в окружении: процесс становится супервизором, перезапускает сам
// себя с токеном, перекачивает stdout/stderr ребёнка, ищет дамп в stderr,
// ждёт завершения и при найденном дампе синхронно вызывает handler.
// Возвращает role=Supervisor, done=true, exitStatus ребёнка.
//
// С токеном: процесс и есть payload. Сразу возвращает role=Payload, done=false,
// дальше выполняется обычная логика программы.
WrapResult wrap(const WrapConfig& config);

// wrap() с конфигурацией по умолчанию, живущей до конца процесса
WrapResult basicWrap(CrashHandler handler);

// nullptr: есть ли токен по умолчанию (RelaunchToken::kDefaultKey) в окружении
// процесса, наследуется потомками. Payload, запущенный с другим
// WrapConfig::tokenKey, здесь получит false: проверяйте его через wrapped(&config).
// config: был ли этот самый экземпляр передан в wrap() в этом процессе и
// ушёл в ветку payload.
bool wrapped(const WrapConfig* config = nullptr);
