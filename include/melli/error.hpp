#pragma once

#include <string>

namespace melli {

struct MelliError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        InvalidNationalId
    };

    Code code;
    std::string message;
    std::string hint;

    MelliError() = default;
    MelliError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    MelliError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // The one failure every national ID check reports, whatever went wrong.
    static MelliError invalid_national_id();

    std::string format() const;
    static const char* code_name(Code c);

    bool operator==(const MelliError& o) const;
    bool operator!=(const MelliError& o) const;
};

} // namespace melli
