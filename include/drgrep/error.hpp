#pragma once

#include <string>

namespace drgrep {

struct DrgrepError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    DrgrepError() = default;
    DrgrepError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DrgrepError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DrgrepError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace drgrep
