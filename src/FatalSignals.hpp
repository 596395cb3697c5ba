#pragma once

// Обработчики SIGSEGV/SIGBUS/SIGFPE/SIGILL/SIGABRT на отдельном стеке:
// пишут "\nfatal signal: NAME (N)\n" в stderr и перевозбуждают сигнал
// с действием по умолчанию. Повторный вызов ничего не делает.
void installFatalSignalHandlers();
