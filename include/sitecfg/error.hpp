#pragma once

#include <string>

namespace sitecfg {

struct SiteError {
    enum Code {
        IO,
        Parse,
        NotFound,
        InvalidArg,
        TypeMismatch,
        RangeViolation,
        EnumViolation,
        StructuralViolation,
        UnsupportedSource,
        ReservedValue
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;
    std::string file;   // config file the value came from, if any
    std::string key;    // dotted config key, e.g. "images.deviceSizes"

    SiteError() = default;
    SiteError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SiteError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Attach the offending key; returns *this for chaining at the error site
    SiteError& at(std::string k) { key = std::move(k); return *this; }
    SiteError& in_file(std::string f) { file = std::move(f); return *this; }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sitecfg
