#pragma once

#include <string>

namespace verspec {

struct VerspecError {
    enum Code {
        IO,
        Parse,
        Config,
        NullInput,     // null or empty text where a value is mandatory
        Format,        // text does not match the version/range grammar
        InvalidArg,
        TypeMismatch
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    std::string input;  // offending text, for Format errors

    VerspecError() = default;
    VerspecError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VerspecError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    VerspecError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Format error for `text` that was not a valid `what`
    static VerspecError bad_format(const std::string& text, const std::string& what,
                                   std::string reason);
};

} // namespace verspec
