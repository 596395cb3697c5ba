#include <catch2/catch.hpp>
#include "CrashDetector.hpp"
#include "CommonTypes.hpp"

#include <string>
#include <utility>

using namespace std::chrono;
using TimePoint = CrashDetector::TimePoint;

static CrashDetector makeDetector(std::vector<std::string> sigs,
                                  milliseconds patience = milliseconds(1000),
                                  milliseconds quiet = milliseconds(0)) {
    return CrashDetector(std::move(sigs), patience, quiet);
}

TEST_CASE("Ordinary text passes through untouched", "[detector]") {
    auto d = makeDetector({ "panic: " });
    TimePoint t0 {};

    REQUIRE(d.feed("hello world\n", t0) == "hello world\n");
    REQUIRE(d.feed("second line without newline", t0) == "second line without newline");
    REQUIRE(d.finish().empty());
    REQUIRE(d.state() == CrashDetector::State::Scanning);
    REQUIRE_FALSE(d.takeCapture());
}

TEST_CASE("Signature at the very first byte is captured", "[detector]") {
    auto d = makeDetector({ "panic: " });
    TimePoint t0 {};

    REQUIRE(d.feed("panic: boom\nmore text", t0).empty());
    REQUIRE(d.state() == CrashDetector::State::Capturing);
    REQUIRE_FALSE(d.takeCapture());   // до конца потока захват не отдаётся

    REQUIRE(d.finish().empty());
    REQUIRE(d.state() == CrashDetector::State::Confirmed);

    auto capture = d.takeCapture();
    REQUIRE(capture);
    REQUIRE(*capture == "panic: boom\nmore text");

    SECTION("capture is handed off only once") {
        REQUIRE_FALSE(d.takeCapture());
    }
}

TEST_CASE("Signature only counts at a line start", "[detector]") {
    auto d = makeDetector({ "panic: " });
    TimePoint t0 {};

    SECTION("mid-line occurrence is ordinary text") {
        REQUIRE(d.feed("we do not panic: ever\n", t0) == "we do not panic: ever\n");
        d.finish();
        REQUIRE_FALSE(d.takeCapture());
    }

    SECTION("text before the dump is released, the dump is held") {
        REQUIRE(d.feed("starting\npanic: x\ntrace", t0) == "starting\n");
        d.finish();
        auto capture = d.takeCapture();
        REQUIRE(capture);
        REQUIRE(*capture == "panic: x\ntrace");
    }
}

TEST_CASE("One byte at a time finds the dump", "[detector]") {
    auto d = makeDetector({ "panic: " });
    TimePoint t0 {};

    std::string input = "ok\npanic: foo\n\n";
    for (int i = 0; i < 1024; ++i)
        input += "foobarbaz";

    std::string released;
    for (char c : input)
        released += d.feed(&c, 1, t0);
    released += d.finish();

    REQUIRE(released == "ok\n");
    auto capture = d.takeCapture();
    REQUIRE(capture);
    REQUIRE(capture->size() == 12 + 1024 * 9);
    REQUIRE(capture->compare(0, 10, "panic: foo") == 0);
}

TEST_CASE("Disproved partial match is flushed and scanning resumes", "[detector]") {
    auto d = makeDetector({ "panic:" });
    TimePoint t0 {};

    REQUIRE(d.feed("pa", t0).empty());
    REQUIRE(d.state() == CrashDetector::State::PartialMatch);

    REQUIRE(d.feed("rty\n", t0) == "party\n");
    REQUIRE(d.state() == CrashDetector::State::Scanning);

    REQUIRE(d.feed("panic: later", t0).empty());
    d.finish();
    auto capture = d.takeCapture();
    REQUIRE(capture);
    REQUIRE(*capture == "panic: later");
}

TEST_CASE("All signatures are matched in parallel", "[detector]") {
    auto d = makeDetector({ "fatal error: ", "fatal signal: " });
    TimePoint t0 {};

    REQUIRE(d.feed("fatal s", t0).empty());
    REQUIRE(d.feed("ignal: SIGSEGV (11)\n", t0).empty());
    d.finish();
    auto capture = d.takeCapture();
    REQUIRE(capture);
    REQUIRE(*capture == "fatal signal: SIGSEGV (11)\n");
}

TEST_CASE("The earliest complete signature wins", "[detector]") {
    auto d = makeDetector({ "abort: now", "abort:" });
    TimePoint t0 {};

    REQUIRE(d.feed("abort:", t0).empty());
    REQUIRE(d.state() == CrashDetector::State::Capturing);
    REQUIRE(d.feed(" later", t0).empty());
    d.finish();
    REQUIRE(*d.takeCapture() == "abort: later");
}

TEST_CASE("Pending partial match waits for the patience window", "[detector][patience]") {
    TimePoint t0 {};

    SECTION("pause shorter than patience still detects the dump") {
        auto d = makeDetector({ "panic:" }, milliseconds(1000));
        REQUIRE(d.feed("pan", t0).empty());
        REQUIRE(d.nextDeadline() == t0 + milliseconds(1000));
        REQUIRE(d.tick(t0 + milliseconds(100)).empty());
        REQUIRE(d.feed("ic: boom", t0 + milliseconds(100)).empty());
        d.finish();
        auto capture = d.takeCapture();
        REQUIRE(capture);
        REQUIRE(*capture == "panic: boom");
    }

    SECTION("pause longer than patience releases the held bytes") {
        auto d = makeDetector({ "panic:" }, milliseconds(50));
        REQUIRE(d.feed("pan", t0).empty());
        REQUIRE(d.tick(t0 + milliseconds(100)) == "pan");
        REQUIRE(d.feed("ic: boom", t0 + milliseconds(100)) == "ic: boom");
        REQUIRE(d.finish().empty());
        REQUIRE_FALSE(d.takeCapture());
    }

    SECTION("zero patience releases at the end of every chunk") {
        auto d = makeDetector({ "panic:" }, milliseconds(0));
        REQUIRE(d.feed("pan", t0) == "pan");
        REQUIRE_FALSE(d.nextDeadline());
        REQUIRE(d.feed("ic: boom", t0) == "ic: boom");
        d.finish();
        REQUIRE_FALSE(d.takeCapture());
    }

    SECTION("stream end releases a pending partial match") {
        auto d = makeDetector({ "panic:" });
        REQUIRE(d.feed("pan", t0).empty());
        REQUIRE(d.finish() == "pan");
        REQUIRE_FALSE(d.takeCapture());
    }
}

TEST_CASE("Quiet period freezes the capture", "[detector][quiet]") {
    auto d = makeDetector({ "panic: " }, milliseconds(1000), milliseconds(100));
    TimePoint t0 {};

    REQUIRE(d.feed("panic: a\n", t0).empty());
    REQUIRE(d.nextDeadline() == t0 + milliseconds(100));
    REQUIRE(d.tick(t0 + milliseconds(50)).empty());
    REQUIRE(d.state() == CrashDetector::State::Capturing);

    d.tick(t0 + milliseconds(150));
    REQUIRE(d.state() == CrashDetector::State::Confirmed);
    REQUIRE(d.feed("later\n", t0 + milliseconds(200)) == "later\n");

    auto capture = d.takeCapture();
    REQUIRE(capture);
    REQUIRE(*capture == "panic: a\n");
}

TEST_CASE("Empty signatures are ignored", "[detector]") {
    auto d = makeDetector({ "" });
    TimePoint t0 {};
    REQUIRE(d.feed("anything\n", t0) == "anything\n");
    d.finish();
    REQUIRE_FALSE(d.takeCapture());
}

TEST_CASE("Default signatures recognise libstdc++ terminate output", "[detector]") {
    CrashDetector d(defaultSignatures(), milliseconds(1000), milliseconds(0));
    TimePoint t0 {};
    std::string dump = "terminate called after throwing an instance of 'std::runtime_error'\n"
                       "  what():  uh oh\n";
    REQUIRE(d.feed("log line\n" + dump, t0) == "log line\n");
    d.finish();
    REQUIRE(*d.takeCapture() == dump);
}
