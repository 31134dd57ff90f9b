#pragma once

#include <string>

namespace acb {

struct AcbError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Archive,
        Process,
        Cancelled,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;   // offending path or archive entry, when known
    int line = 0;

    AcbError() = default;
    AcbError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    AcbError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    AcbError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace acb
