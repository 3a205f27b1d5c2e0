#pragma once

#include <string>

namespace resx {

struct ResxError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        NotFound,
        DuplicateKey,
        Immutable
    };

    Code code;
    std::string message;
    std::string hint;
    std::string key;        // resource key the error refers to, if any
    std::string culture;    // culture display name, if any

    ResxError() = default;
    ResxError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ResxError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ResxError(Code c, std::string msg, std::string h, std::string k,
              std::string cul)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          key(std::move(k)), culture(std::move(cul)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace resx
