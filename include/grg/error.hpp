#pragma once

#include <string>

namespace grg {

struct GrgError {
    enum Code {
        IO,
        Config,
        InvalidArg,
        NotFound,
        Workspace,
        Fetch,
        Metadata,
        Process
    };

    Code code;
    std::string message;
    std::string hint;

    GrgError() = default;
    GrgError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    GrgError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // "error[Code]: message" plus an indented hint line when set
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace grg
