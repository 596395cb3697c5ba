#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Инкрементальный поиск аварийного дампа в байтовом потоке.
//
// Сигнатура засчитывается только с начала строки. Пока накопленные байты
// совпадают с префиксом хотя бы одной сигнатуры, они придерживаются; после
// полного совпадения всё до конца потока уходит в захват и наружу не
// отдаётся. Время передаётся снаружи, сам детектор часов не читает.
//
// Не потокобезопасен: им владеет один поток (stderr-насос).
class CrashDetector {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    enum class State { Scanning, PartialMatch, Capturing, Confirmed };

    // patience: сколько придерживать незавершённую сигнатуру без новых байтов,
    //           0 = отпускать в конце каждого feed().
    // quietPeriod: тишина в Capturing, после которой захват фиксируется, 0 = только EOF.
    CrashDetector(std::vector<std::string> signatures,
                  std::chrono::milliseconds patience,
                  std::chrono::milliseconds quietPeriod);

    // Обработать очередной кусок. Возвращает байты, которые можно отдать дальше.
    std::string feed(const char* data, size_t len, TimePoint now);
    std::string feed(const std::string& chunk, TimePoint now) { return feed(chunk.data(), chunk.size(), now); }

    // Проверка таймеров без новых данных (patience и quietPeriod).
    std::string tick(TimePoint now);

    // Конец потока: незавершённое совпадение отпускается, захват фиксируется.
    std::string finish();

    // Ближайший момент, когда tick() может что-то изменить
    std::optional<TimePoint> nextDeadline() const;

    // Зафиксированный захват, отдаётся ровно один раз
    std::optional<std::string> takeCapture();

    State state() const { return state_; }
    size_t capturedBytes() const { return capture_.size(); }

private:
    void startCandidates(char c);
    void release(std::string& out);

    std::vector<std::string>  signatures_;
    std::chrono::milliseconds patience_;
    std::chrono::milliseconds quietPeriod_;

    State                state_ = State::Scanning;
    bool                 atLineStart_ = true;
    std::string          pending_;      // придержанные байты PartialMatch
    std::vector<size_t>  candidates_;   // индексы сигнатур, всё ещё совпадающих с pending_
    std::string          capture_;
    bool                 handedOff_ = false;
    TimePoint            lastInput_ {};
};
