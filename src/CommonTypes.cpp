#include "CommonTypes.hpp"

const char* wrapErrorName(WrapError e) {
    switch (e) {
    case WrapError::None:   return "none";
    case WrapError::Config: return "config error";
    case WrapError::Spawn:  return "spawn error";
    case WrapError::Stream: return "stream error";
    case WrapError::Wait:   return "wait error";
    }
    return "unknown error";
}

std::vector<std::string> defaultSignatures() {
    return {
        "terminate called after throwing an instance of ",
        "terminate called without an active exception",
        "terminate called recursively",
        "libc++abi: terminating",
        "fatal signal: ",
        "*** stack smashing detected ***",
        "*** buffer overflow detected ***",
        "double free or corruption",
        "free(): invalid",
        "malloc(): ",
        "munmap_chunk(): invalid pointer",
        "corrupted size vs. prev_size",
        "AddressSanitizer:DEADLYSIGNAL",
    };
}
