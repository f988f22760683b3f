#include <melli/error.hpp>

namespace melli {

MelliError MelliError::invalid_national_id() {
    return MelliError{InvalidNationalId, "invalid iranian national id number"};
}

const char* MelliError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Config:            return "Config";
        case InvalidArg:        return "InvalidArg";
        case InvalidNationalId: return "InvalidNationalId";
    }
    return "Unknown";
}

std::string MelliError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

bool MelliError::operator==(const MelliError& o) const {
    return code == o.code && message == o.message && hint == o.hint;
}

bool MelliError::operator!=(const MelliError& o) const {
    return !(*this == o);
}

} // namespace melli
