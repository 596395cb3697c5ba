#include <catch2/catch.hpp>
#include "TestProcess.hpp"

#include <regex>
#include <string>

#ifndef CRASHWRAP_HELPER_PATH
#error "CRASHWRAP_HELPER_PATH must point to the crashwrap_helper binary"
#endif

static TestProcess::Output runHelper(const std::vector<std::string>& args, const std::string& input = "") {
    std::vector<std::string> argv { CRASHWRAP_HELPER_PATH };
    argv.insert(argv.end(), args.begin(), args.end());
    TestProcess p(argv, input);
    REQUIRE(p.started());
    return p.finish();
}

// "wrapped: N" из обработчика, -1 если обработчик не вызывался
static long handledLength(const std::string& out) {
    static const std::regex re("wrapped: (\\d+)");
    std::smatch m;
    if (!std::regex_search(out, m, re))
        return -1;
    return std::stol(m[1].str());
}

TEST_CASE("Ordinary output is forwarded on both streams", "[helper]") {
    auto r = runHelper({ "no-crash-output" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("i am output") != std::string::npos);
    REQUIRE(r.err.find("stderr out") != std::string::npos);
    REQUIRE(handledLength(r.out) == -1);
}

TEST_CASE("Payload exit code is propagated", "[helper]") {
    auto r = runHelper({ "exit-code", "42" });
    REQUIRE(r.exitCode == 42);
    REQUIRE(handledLength(r.out) == -1);
}

TEST_CASE("Uncaught exception is captured", "[helper]") {
    SECTION("hidden") {
        auto r = runHelper({ "crash", "hide" });
        REQUIRE(r.exitCode == 0);
        REQUIRE(handledLength(r.out) > 0);
        REQUIRE(r.err.find("terminate called") == std::string::npos);
    }

    SECTION("shown") {
        auto r = runHelper({ "crash", "show" });
        REQUIRE(r.exitCode == 0);
        REQUIRE(handledLength(r.out) > 0);
        REQUIRE(r.err.find("terminate called after throwing an instance of 'std::runtime_error'") != std::string::npos);
    }
}

TEST_CASE("Long dump is captured whole", "[helper]") {
    auto r = runHelper({ "long" });
    REQUIRE(r.exitCode == 0);
    long len = handledLength(r.out);
    REQUIRE(len >= 12 + 1024 * 9);
    // дамп показан в stderr целиком и больше там ничего нет
    REQUIRE(len == long(r.err.size()));
    REQUIRE(r.err.compare(0, 12, "panic: foo\n\n") == 0);
    REQUIRE(r.err.find("I AM REAL!") != std::string::npos);
}

TEST_CASE("Dump written one byte at a time is captured", "[helper]") {
    auto r = runHelper({ "one-byte" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(handledLength(r.out) == long(std::string("terminate called after throwing an instance of 'Oops'\n").size()));
}

TEST_CASE("Signature split by a pause", "[helper][patience]") {
    SECTION("is detected within the patience window") {
        auto r = runHelper({ "boundary" });
        REQUIRE(r.exitCode == 0);
        REQUIRE(handledLength(r.out) == long(std::string("panic: boom").size()));
    }

    SECTION("is lost with zero patience") {
        auto r = runHelper({ "boundary-impatient" });
        REQUIRE(r.exitCode == 2);
        REQUIRE(handledLength(r.out) == -1);
        REQUIRE(r.err == "panic: boom");
    }
}

TEST_CASE("Text resembling a signature prefix passes through", "[helper]") {
    auto r = runHelper({ "ordinary-prefix" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(handledLength(r.out) == -1);
    REQUIRE(r.err == "terminate the session please\ndone\n");
}

TEST_CASE("Quiet period ends the capture", "[helper][quiet]") {
    auto r = runHelper({ "quiet" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(handledLength(r.out) == long(std::string("panic: first\n").size()));
    REQUIRE(r.err == "after\n");
}

TEST_CASE("Fatal signal is reported and captured", "[helper]") {
    auto r = runHelper({ "segv" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(handledLength(r.out) > 0);
    REQUIRE(r.err.find("fatal signal: SIGSEGV (11)") != std::string::npos);
}

TEST_CASE("Silent signal death keeps the 128 + signal status", "[helper]") {
    auto r = runHelper({ "killed" });
    REQUIRE(r.exitCode == 128 + SIGKILL);
    REQUIRE(handledLength(r.out) == -1);
}

TEST_CASE("Standard input is inherited by the payload", "[helper]") {
    auto r = runHelper({ "stdin" }, "hello\n");
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out == "echo: hello");
}

TEST_CASE("SIGTERM to the supervisor is forwarded to the payload", "[helper][signals]") {
    TestProcess p({ CRASHWRAP_HELPER_PATH, "sleep" });
    REQUIRE(p.started());
    REQUIRE(p.waitForStdout("ready", 10000));
    p.signal(SIGTERM);
    auto r = p.finish();
    REQUIRE(r.exitCode == 128 + SIGTERM);
}

TEST_CASE("Payload reports itself wrapped", "[helper][wrapped]") {
    auto r = runHelper({ "wrapped", "child" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("global=true config=true") != std::string::npos);
}

TEST_CASE("Supervisor reports itself not wrapped", "[helper][wrapped]") {
    auto r = runHelper({ "wrapped" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("global=false config=false") != std::string::npos);
}

TEST_CASE("Independent descendant of a payload is not wrapped for a fresh config", "[helper][wrapped]") {
    auto r = runHelper({ "recursive" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("fresh=false") != std::string::npos);
    REQUIRE(r.out.find("inherited=true") != std::string::npos);
}

TEST_CASE("Unrelated config is not wrapped in the supervisor", "[helper][wrapped]") {
    auto r = runHelper({ "two-configs" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("A=false B=false") != std::string::npos);
}

TEST_CASE("Payload under a custom token key is wrapped only per config", "[helper][wrapped]") {
    auto r = runHelper({ "custom-key" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("global=false config=true") != std::string::npos);
}

TEST_CASE("Second wrap in a payload does not relaunch again", "[helper][wrapped]") {
    auto r = runHelper({ "twice" });
    REQUIRE(r.exitCode == 0);
    REQUIRE(r.out.find("second=payload second-wrapped=true") != std::string::npos);
}
