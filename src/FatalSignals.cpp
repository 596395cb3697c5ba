#include "FatalSignals.hpp"
#include "Logger.hpp"

#include <signal.h>
#include <unistd.h>
#include <cstring>
#include <mutex>

namespace {

char g_altStack[64 * 1024];

struct FatalSignal { int sig; const char* name; };

const FatalSignal kFatalSignals[] = {
    { SIGSEGV, "SIGSEGV" },
    { SIGBUS,  "SIGBUS"  },
    { SIGFPE,  "SIGFPE"  },
    { SIGILL,  "SIGILL"  },
    { SIGABRT, "SIGABRT" },
};

// только async-signal-safe вызовы
void writeStr(const char* s) {
    size_t len = std::strlen(s);
    while (len > 0) {
        ssize_t n = ::write(STDERR_FILENO, s, len);
        if (n <= 0) return;
        s += n;
        len -= size_t(n);
    }
}

void onFatalSignal(int sig) {
    const char* name = "UNKNOWN";
    for (auto& fs : kFatalSignals) {
        if (fs.sig == sig) name = fs.name;
    }

    char num[16];
    int  pos = sizeof(num) - 1;
    num[pos] = '\0';
    int v = sig;
    do {
        num[--pos] = char('0' + v % 10);
        v /= 10;
    } while (v > 0 && pos > 0);

    writeStr("\nfatal signal: ");
    writeStr(name);
    writeStr(" (");
    writeStr(num + pos);
    writeStr(")\n");

    ::signal(sig, SIG_DFL);
    ::raise(sig);
}

} // namespace

void installFatalSignalHandlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        stack_t ss {};
        ss.ss_sp    = g_altStack;
        ss.ss_size  = sizeof(g_altStack);
        ss.ss_flags = 0;
        if (::sigaltstack(&ss, nullptr) != 0)
            Logger::warn("FatalSignals: sigaltstack failed, stack overflow will not be reported");

        struct sigaction sa {};
        sa.sa_handler = onFatalSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_ONSTACK | SA_RESETHAND;
        for (auto& fs : kFatalSignals) {
            if (::sigaction(fs.sig, &sa, nullptr) != 0)
                Logger::warn("FatalSignals: sigaction(%s) failed", fs.name);
        }
    });
}
