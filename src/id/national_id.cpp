#include <melli/national_id.hpp>
#include <melli/validator.hpp>

namespace melli {

Result<NationalId> NationalId::parse(const std::string& raw) {
    auto canonical = validate_national_id(raw);
    MELLI_TRY(canonical);

    NationalId id;
    id.value_ = std::move(canonical).value();
    return Result<NationalId>::ok(std::move(id));
}

bool NationalId::is_valid(const std::string& raw) {
    return validate_national_id(raw).is_ok();
}

const std::string& NationalId::str() const { return value_; }

NationalId::operator const std::string&() const { return value_; }

std::string NationalId::to_string() const { return value_; }

bool NationalId::operator==(const NationalId& o) const {
    return value_ == o.value_;
}

bool NationalId::operator!=(const NationalId& o) const {
    return !(*this == o);
}

bool NationalId::operator<(const NationalId& o) const {
    return value_ < o.value_;
}

bool NationalId::operator<=(const NationalId& o) const {
    return !(o < *this);
}

bool NationalId::operator>(const NationalId& o) const {
    return o < *this;
}

bool NationalId::operator>=(const NationalId& o) const {
    return !(*this < o);
}

} // namespace melli
