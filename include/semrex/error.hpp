#pragma once

#include <ostream>
#include <string>

namespace semrex {

struct SemrexError {
    enum Code {
        Parse,
        UnsupportedOperator,
        DialectUnsupported,
        Regex,
        Config,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SemrexError() = default;
    SemrexError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SemrexError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SemrexError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Prepend "context: " to the message, e.g. which side of a range failed.
    SemrexError& prefix(const std::string& context);

    std::string format() const;
    static const char* code_name(Code c);
};

std::ostream& operator<<(std::ostream& os, const SemrexError& e);

} // namespace semrex
