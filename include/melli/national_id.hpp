#pragma once

#include <melli/result.hpp>
#include <string>

namespace melli {

// A validated Iranian national ID. The only way to obtain one is parse(),
// so holding a NationalId means the checksum has already been verified.
// Canonical form: exactly ten decimal digits, zero-padded on the left.
class NationalId {
public:
    static Result<NationalId> parse(const std::string& raw);
    static bool is_valid(const std::string& raw);

    const std::string& str() const;
    operator const std::string&() const;
    std::string to_string() const;

    bool operator==(const NationalId& o) const;
    bool operator!=(const NationalId& o) const;
    bool operator<(const NationalId& o) const;
    bool operator<=(const NationalId& o) const;
    bool operator>(const NationalId& o) const;
    bool operator>=(const NationalId& o) const;

private:
    NationalId() = default;

    std::string value_;
};

} // namespace melli
