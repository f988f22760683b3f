#include <catch2/catch.hpp>
#include <melli/validator.hpp>
#include <string>
#include <vector>

using namespace melli;

static bool rejected(const std::string& input) {
    auto r = validate_national_id(input);
    return r.is_err() && r.error() == MelliError::invalid_national_id();
}

// ===== Accepted inputs =====

TEST_CASE("validate known national ids", "[validator]") {
    for (const char* id : {"0451726707", "0040010007", "0814659438"}) {
        auto r = validate_national_id(id);
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == id);
    }
}

TEST_CASE("remainder below two uses it as control digit", "[validator]") {
    // S = 210, r = 1
    auto r = validate_national_id("1234567891");
    REQUIRE(r.is_ok());
    // S = 11, r = 0
    REQUIRE(validate_national_id("0000011010").is_ok());
}

TEST_CASE("remainder of two needs control digit nine", "[validator]") {
    // S = 13, r = 2
    REQUIRE(validate_national_id("1000000109").is_ok());
    REQUIRE(rejected("1000000102"));
}

TEST_CASE("short input is left-padded with zeros", "[validator]") {
    auto r = validate_national_id("451726707");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "0451726707");

    auto r2 = validate_national_id("40010007");
    REQUIRE(r2.is_ok());
    REQUIRE(r2.value() == "0040010007");

    auto r3 = validate_national_id("11010");
    REQUIRE(r3.is_ok());
    REQUIRE(r3.value() == "0000011010");
}

TEST_CASE("surrounding whitespace is trimmed", "[validator]") {
    auto r = validate_national_id("  0451726707\t");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "0451726707");

    auto r2 = validate_national_id("\n40010007  \r\n");
    REQUIRE(r2.is_ok());
    REQUIRE(r2.value() == "0040010007");
}

// ===== Rejected inputs =====

TEST_CASE("empty and blank input rejected", "[validator]") {
    REQUIRE(rejected(""));
    REQUIRE(rejected("   "));
    REQUIRE(rejected("\t\n"));
}

TEST_CASE("inputs with non-digits rejected", "[validator]") {
    REQUIRE(rejected("123"));
    REQUIRE(rejected("123456ab"));
    REQUIRE(rejected("12345678ab"));
    REQUIRE(rejected("a814659438"));
    REQUIRE(rejected("0814 659438"));
    REQUIRE(rejected("+814659438"));
}

TEST_CASE("only ASCII whitespace is trimmed", "[validator]") {
    // U+00A0 NO-BREAK SPACE and U+2003 EM SPACE in UTF-8
    REQUIRE(rejected("\xc2\xa0" "0451726707"));
    REQUIRE(rejected("0451726707" "\xc2\xa0"));
    REQUIRE(rejected("\xe2\x80\x83" "0451726707"));
    REQUIRE(validate_national_id("\v\f 0451726707 \r").is_ok());
}

TEST_CASE("eleven characters with ten digits rejected", "[validator]") {
    REQUIRE(rejected("0451-726707"));
    REQUIRE(rejected("045.1726707"));
}

TEST_CASE("too many digits rejected", "[validator]") {
    REQUIRE(rejected("04517267070"));
    REQUIRE(rejected("00451726707"));
}

TEST_CASE("all-zero leading digits rejected", "[validator]") {
    REQUIRE(rejected("0000000000"));
    REQUIRE(rejected("0000000001"));
    REQUIRE(rejected("0"));
}

TEST_CASE("wrong control digit rejected", "[validator]") {
    for (char c = '0'; c <= '9'; ++c) {
        std::string id = "045172670" + std::string(1, c);
        if (c == '7') {
            REQUIRE(validate_national_id(id).is_ok());
        } else {
            REQUIRE(rejected(id));
        }
    }
}

TEST_CASE("failure is the same value for every reason", "[validator]") {
    auto a = validate_national_id("");
    auto b = validate_national_id("12345678ab");
    auto c = validate_national_id("0451726708");
    REQUIRE(a == b);
    REQUIRE(b == c);
    REQUIRE(a.error().format() == "error[InvalidNationalId]: invalid iranian national id number");
}

// ===== Laws =====

TEST_CASE("validation is deterministic", "[validator]") {
    for (const char* in : {"0451726707", " 40010007 ", "bogus", ""}) {
        REQUIRE(validate_national_id(in) == validate_national_id(in));
    }
}

TEST_CASE("canonical form revalidates to itself", "[validator]") {
    for (const char* in : {"0451726707", "40010007", "  814659438 ", "11010"}) {
        auto first = validate_national_id(in);
        REQUIRE(first.is_ok());
        auto second = validate_national_id(first.value());
        REQUIRE(second == first);
    }
}

TEST_CASE("padding and trimming do not change the outcome", "[validator]") {
    std::vector<std::string> inputs = {
        "451726707", "40010007", "814659438", "11010", "123", "1", "451726708"
    };
    for (const auto& in : inputs) {
        std::string padded = std::string(10 - in.size(), '0') + in;
        REQUIRE(validate_national_id(in) == validate_national_id(padded));
        REQUIRE(validate_national_id(" \t" + in + " ") == validate_national_id(in));
    }
}

TEST_CASE("accepted ids hold the checksum relation", "[validator]") {
    for (const char* in : {"0451726707", "0040010007", "0814659438",
                           "1234567891", "0000011010", "1000000109"}) {
        auto r = validate_national_id(in);
        REQUIRE(r.is_ok());
        const std::string& id = r.value();
        REQUIRE(id.size() == kNationalIdLength);

        int sum = 0;
        for (size_t i = 0; i < 9; ++i) {
            REQUIRE(id[i] >= '0');
            REQUIRE(id[i] <= '9');
            sum += (id[i] - '0') * static_cast<int>(10 - i);
        }
        REQUIRE(sum != 0);
        int rem = sum % 11;
        int control = id[9] - '0';
        REQUIRE(((rem < 2 && control == rem) || (rem >= 2 && control + rem == 11)));
    }
}

// ===== Control digit =====

TEST_CASE("control digit for known bodies", "[validator]") {
    REQUIRE(national_id_control_digit("045172670").value() == 7);
    REQUIRE(national_id_control_digit("004001000").value() == 7);
    REQUIRE(national_id_control_digit("081465943").value() == 8);
    REQUIRE(national_id_control_digit("123456789").value() == 1);
    REQUIRE(national_id_control_digit("000001101").value() == 0);
    REQUIRE(national_id_control_digit("100000010").value() == 9);
}

TEST_CASE("control digit completes a valid id", "[validator]") {
    for (const char* body : {"987654321", "111111111", "000000001", "555000111", "909090909"}) {
        auto digit = national_id_control_digit(body);
        REQUIRE(digit.is_ok());
        std::string id = std::string(body) + std::to_string(digit.value());
        REQUIRE(validate_national_id(id).is_ok());
    }
}

TEST_CASE("control digit of all-zero body rejected", "[validator]") {
    auto r = national_id_control_digit("000000000");
    REQUIRE(r.is_err());
    REQUIRE(r.error() == MelliError::invalid_national_id());
}

TEST_CASE("control digit needs exactly nine digits", "[validator]") {
    auto short_body = national_id_control_digit("12345678");
    REQUIRE(short_body.is_err());
    REQUIRE(short_body.error().code == MelliError::InvalidArg);

    auto long_body = national_id_control_digit("1234567890");
    REQUIRE(long_body.is_err());
    REQUIRE(long_body.error().code == MelliError::InvalidArg);

    auto bad_char = national_id_control_digit("12345678x");
    REQUIRE(bad_char.is_err());
    REQUIRE(bad_char.error().code == MelliError::InvalidArg);
    REQUIRE(bad_char.error().message.find("'x'") != std::string::npos);
}
