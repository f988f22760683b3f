#pragma once

#include <melli/result.hpp>
#include <cstddef>
#include <string>

namespace melli {

// Digits in a national ID, control digit included.
constexpr std::size_t kNationalIdLength = 10;

// Trims surrounding whitespace, left-pads with '0' to ten characters and
// checks the control digit. On success returns the canonical ten-digit
// form; every failure is MelliError::invalid_national_id().
Result<std::string> validate_national_id(const std::string& input);

// Control digit completing the nine leading digits in `body`.
Result<int> national_id_control_digit(const std::string& body);

} // namespace melli
