#pragma once

#include <string>

namespace ulid {

struct UlidError {
    enum Code {
        Range,      // timestamp outside [MinTimestamp, MaxTimestamp]
        Length,     // byte buffer of the wrong size
        Format,     // text not a canonical 26-symbol identifier
        Overflow,   // randomness exhausted within one millisecond
        Entropy,
        IO,
        Parse,
        Config
    };

    Code code;
    std::string message;
    std::string hint;

    UlidError() = default;
    UlidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UlidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ulid
