#include "Logger.hpp"
#include "CrashWrap.hpp"
#include "CrashReporter.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <stdexcept>
#include <chrono>
#include <unistd.h>
#include <string>

struct Args {
    std::string mode = "ok";
    std::string reportUrl;
    std::string crashDir;
    std::string logfile;
    long        patienceMs = -1;
    long        quietMs = -1;
    bool        hide = false;
    bool        debug = false;
};

static bool parseArgs(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string s(argv[i]);
        if (s == "debug") {
            args.debug = true;
        } else if (s == "--hide") {
            args.hide = true;
        } else if (s.rfind("--mode=", 0) == 0) {
            args.mode = s.substr(7);
        } else if (s.rfind("--report-url=", 0) == 0) {
            args.reportUrl = s.substr(13);
        } else if (s.rfind("--crash-dir=", 0) == 0) {
            args.crashDir = s.substr(12);
        } else if (s.rfind("--logfile=", 0) == 0) {
            args.logfile = s.substr(10);
        } else if (s.rfind("--patience=", 0) == 0) {
            args.patienceMs = std::atol(s.c_str() + 11);
        } else if (s.rfind("--quiet=", 0) == 0) {
            args.quietMs = std::atol(s.c_str() + 8);
        } else {
            std::fprintf(stderr, "Unknown argument: %s\n", s.c_str());
            return false;
        }
    }
    return true;
}

// Логика программы, которая работает под надзором
static int runPayload(const Args& args) {
    std::printf("payload pid %d running mode '%s'\n", (int)getpid(), args.mode.c_str());
    std::fflush(stdout);

    if (args.mode == "ok") {
        std::fprintf(stderr, "warning: nothing to do\n");
        return 0;
    }
    if (args.mode == "throw") {
        throw std::runtime_error("demo failure");
    }
    if (args.mode == "segv") {
        volatile int* p = nullptr;
        *p = 1;
        return 0;
    }
    if (args.mode == "abort") {
        std::abort();
    }
    if (args.mode.rfind("exit:", 0) == 0) {
        return std::atoi(args.mode.c_str() + 5);
    }
    std::fprintf(stderr, "Unknown mode: %s\n", args.mode.c_str());
    return 2;
}

int main(int argc, char* argv[]) {
    Args args;
    if (!parseArgs(argc, argv, args)) {
        std::fprintf(stderr,
            "Usage: %s [debug] [--hide] [--mode=ok|throw|segv|abort|exit:N] [--report-url=...] [--crash-dir=...] [--logfile=...] [--patience=MS] [--quiet=MS]\n",
            argv[0]);
        return 1;
    }

    Logger::init(args.debug ? Logger::Level::Debug : Logger::Level::Warn);
    Logger::initFromEnv("CRASHWRAP_LOG");

    // лог супервизора и payload в один файл, payload дописывает
    FILE* logfp = nullptr;
    if (!args.logfile.empty()) {
        logfp = std::fopen(args.logfile.c_str(), wrapped() ? "a" : "w");
        if (!logfp) {
            std::fprintf(stderr, "Cannot open logfile: %s\n", args.logfile.c_str());
            return 1;
        }
        Logger::setFile(logfp);
    }

    CrashReporter reporter(args.reportUrl, args.crashDir);
    CrashHandler report = reporter.handler();
    bool crashed = false;

    WrapConfig config;
    config.hideCapture = args.hide;
    if (args.patienceMs >= 0)
        config.patience = std::chrono::milliseconds(args.patienceMs);
    if (args.quietMs >= 0)
        config.quietPeriod = std::chrono::milliseconds(args.quietMs);
    config.handler = [&](const std::string& capture) {
        crashed = true;
        std::fprintf(stderr, "\nThe program crashed, %zu bytes of diagnostics were captured.\n", capture.size());
        report(capture);
    };

    if (Logger::isDebug()) {
        for (auto& sig : config.signatures)
            Logger::debug("signature: \"%s\"", sig.c_str());
    }

    WrapResult res = wrap(config);
    if (!res.ok() && !res.done) {
        std::fprintf(stderr, "crashwrap: %s: %s\n", wrapErrorName(res.error), res.message.c_str());
        return 1;
    }

    int code;
    if (res.role == WrapRole::Payload) {
        code = runPayload(args);
    } else {
        if (!res.ok())
            Logger::warn("supervisor finished with %s: %s", wrapErrorName(res.error), res.message.c_str());
        Logger::info("payload exited with status %d", res.exitStatus);
        // после обработанного падения код выхода фиксированный
        code = crashed ? 1 : res.exitStatus;
    }

    if (logfp) {
        Logger::setFile(nullptr);
        std::fclose(logfp);
    }
    return code;
}
