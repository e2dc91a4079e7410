#ifndef UUID_HPP
#define UUID_HPP
#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
namespace UUID{
    // A single UUID field. Only the integer is stored, the binary and
    // hexadecimal renderings are zero padded to the field width.
    struct Field {
        std::uint64_t value;
        std::size_t width; // in bits.

        std::string bits() const;
        std::string hex() const;
    };

    // UUID binary fields as defined in IETF RFC 4122:
    // https://datatracker.ietf.org/doc/html/rfc4122#section-4.1.2
    // This is 16 octets of data split into six fields. Field values wider
    // than their field are truncated on construction, so construction
    // never fails. A default constructed Uuid is the nil UUID.
    class Uuid{
    public:
        constexpr static std::size_t num_fields = 6;
        constexpr static std::array<std::size_t, num_fields> field_widths{32, 16, 16, 8, 8, 48};
        constexpr static std::array<std::string_view, num_fields> field_names{
            "time_low",
            "time_mid",
            "time_hi_and_version",
            "clock_seq_hi_and_reserved",
            "clock_seq_low",
            "node"
        };
        constexpr static std::size_t string_length = 36;

        explicit Uuid(
            std::uint64_t time_low = 0,
            std::uint64_t time_mid = 0,
            std::uint64_t time_hi_and_version = 0,
            std::uint64_t clock_seq_hi_and_reserved = 0,
            std::uint64_t clock_seq_low = 0,
            std::uint64_t node = 0
        );

        std::uint32_t time_low() const { return static_cast<std::uint32_t>(fields_[0]); }
        std::uint16_t time_mid() const { return static_cast<std::uint16_t>(fields_[1]); }
        std::uint16_t time_hi_and_version() const { return static_cast<std::uint16_t>(fields_[2]); }
        std::uint8_t clock_seq_hi_and_reserved() const { return static_cast<std::uint8_t>(fields_[3]); }
        std::uint8_t clock_seq_low() const { return static_cast<std::uint8_t>(fields_[4]); }
        std::uint64_t node() const { return fields_[5]; }

        // Bits 12-15 of time_hi_and_version.
        unsigned version() const { return (fields_[2] >> 12) & 0xF; }

        // Field access by position or by RFC 4122 name.
        // Both throw std::out_of_range on an unknown field.
        Field field(std::size_t idx) const;
        Field field(std::string_view name) const;
        // Unchecked, idx must be below num_fields.
        Field operator[](std::size_t idx) const { return Field{fields_[idx], field_widths[idx]}; }

        // 128 character binary rendering of all six fields.
        std::string bit_string() const;
        // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
        std::string hex_string() const;
        std::string str() const { return hex_string(); }

        bool equals(const Uuid& other) const;
    private:
        std::array<std::uint64_t, num_fields> fields_;
    };
    bool operator==(const Uuid& lhs, const Uuid& rhs);
    bool operator!=(const Uuid& lhs, const Uuid& rhs);

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
    // Reads the 36 character canonical form. On malformed input the
    // failbit is set and uuid is left untouched.
    std::istream& operator>>(std::istream& is, Uuid& uuid);

    // Decodes the canonical hyphenated form (case-insensitive).
    // Returns std::nullopt for anything else.
    std::optional<Uuid> parse(std::string_view str);
}// uuid namespace
#endif
