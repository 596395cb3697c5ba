#include "CrashDetector.hpp"

#include <cstring>
#include <utility>

CrashDetector::CrashDetector(std::vector<std::string> signatures,
                             std::chrono::milliseconds patience,
                             std::chrono::milliseconds quietPeriod)
  : patience_(patience)
  , quietPeriod_(quietPeriod)
{
    // пустая сигнатура совпала бы с любой строкой
    for (auto& s : signatures) {
        if (!s.empty())
            signatures_.push_back(std::move(s));
    }
}

void CrashDetector::startCandidates(char c) {
    candidates_.clear();
    for (size_t i = 0; i < signatures_.size(); ++i) {
        if (signatures_[i][0] == c)
            candidates_.push_back(i);
    }
}

void CrashDetector::release(std::string& out) {
    if (!pending_.empty()) {
        out += pending_;
        atLineStart_ = pending_.back() == '\n';
    }
    pending_.clear();
    candidates_.clear();
    state_ = State::Scanning;
}

std::string CrashDetector::feed(const char* data, size_t len, TimePoint now) {
    std::string out;
    if (len == 0)
        return out;
    lastInput_ = now;

    size_t i = 0;
    while (i < len) {
        switch (state_) {
        case State::Confirmed:
            out.append(data + i, len - i);
            return out;

        case State::Capturing:
            capture_.append(data + i, len - i);
            return out;

        case State::Scanning: {
            if (!atLineStart_) {
                // до конца строки сигнатур не бывает
                const char* nl = static_cast<const char*>(std::memchr(data + i, '\n', len - i));
                size_t end = nl ? size_t(nl - data) + 1 : len;
                out.append(data + i, end - i);
                atLineStart_ = nl != nullptr;
                i = end;
                break;
            }
            char c = data[i++];
            startCandidates(c);
            if (candidates_.empty()) {
                out.push_back(c);
                atLineStart_ = c == '\n';
                break;
            }
            pending_.assign(1, c);
            state_ = State::PartialMatch;
            break;
        }

        case State::PartialMatch: {
            char c = data[i++];
            size_t pos = pending_.size();
            pending_.push_back(c);
            std::vector<size_t> still;
            for (size_t idx : candidates_) {
                if (signatures_[idx][pos] == c)
                    still.push_back(idx);
            }
            candidates_.swap(still);
            if (candidates_.empty())
                release(out);
            break;
        }
        }

        if (state_ == State::PartialMatch) {
            for (size_t idx : candidates_) {
                if (signatures_[idx].size() == pending_.size()) {
                    capture_ = std::move(pending_);
                    pending_.clear();
                    candidates_.clear();
                    state_ = State::Capturing;
                    break;
                }
            }
        }
    }

    if (state_ == State::PartialMatch && patience_.count() == 0)
        release(out);
    return out;
}

std::string CrashDetector::tick(TimePoint now) {
    std::string out;
    if (state_ == State::PartialMatch && patience_.count() > 0 && now - lastInput_ >= patience_) {
        release(out);
    } else if (state_ == State::Capturing && quietPeriod_.count() > 0 && now - lastInput_ >= quietPeriod_) {
        state_ = State::Confirmed;
    }
    return out;
}

std::string CrashDetector::finish() {
    std::string out;
    if (state_ == State::PartialMatch)
        release(out);
    else if (state_ == State::Capturing)
        state_ = State::Confirmed;
    return out;
}

std::optional<CrashDetector::TimePoint> CrashDetector::nextDeadline() const {
    if (state_ == State::PartialMatch && patience_.count() > 0)
        return lastInput_ + patience_;
    if (state_ == State::Capturing && quietPeriod_.count() > 0)
        return lastInput_ + quietPeriod_;
    return std::nullopt;
}

std::optional<std::string> CrashDetector::takeCapture() {
    if (state_ != State::Confirmed || handedOff_)
        return std::nullopt;
    handedOff_ = true;
    return std::move(capture_);
}
