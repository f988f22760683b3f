#include <melli/validator.hpp>
#include <cctype>

namespace melli {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// ASCII whitespace only; anything else is left for the digit check to reject.
static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

// S = sum of d[i] * (10 - i) over the nine leading digits.
static int weighted_sum(const std::string& digits) {
    int sum = 0;
    for (size_t i = 0; i < kNationalIdLength - 1; ++i) {
        sum += (digits[i] - '0') * static_cast<int>(kNationalIdLength - i);
    }
    return sum;
}

static int control_digit_for(int sum) {
    int rem = sum % 11;
    return rem < 2 ? rem : 11 - rem;
}

Result<std::string> validate_national_id(const std::string& input) {
    std::string value = trim(input);

    // Non-digits reject outright; padding below only adds '0'.
    for (char c : value) {
        if (!is_digit(c)) return MelliError::invalid_national_id();
    }

    if (value.size() < kNationalIdLength) {
        value.insert(0, kNationalIdLength - value.size(), '0');
    }
    if (value.size() != kNationalIdLength) {
        return MelliError::invalid_national_id();
    }

    int sum = weighted_sum(value);
    if (sum == 0) {
        return MelliError::invalid_national_id();
    }

    int control = value[kNationalIdLength - 1] - '0';
    if (control != control_digit_for(sum)) {
        return MelliError::invalid_national_id();
    }

    return Result<std::string>::ok(std::move(value));
}

Result<int> national_id_control_digit(const std::string& body) {
    if (body.size() != kNationalIdLength - 1) {
        return MelliError{MelliError::InvalidArg,
            "national id body must be 9 digits, got " +
            std::to_string(body.size()) + " characters"};
    }
    for (char c : body) {
        if (!is_digit(c)) {
            return MelliError{MelliError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in national id body '" + body + "'",
                "only the digits 0-9 are allowed"};
        }
    }

    int sum = weighted_sum(body);
    if (sum == 0) {
        return MelliError::invalid_national_id();
    }
    return Result<int>::ok(control_digit_for(sum));
}

} // namespace melli
