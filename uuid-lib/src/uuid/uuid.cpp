#include "uuid.hpp"
#include "../codec/codec.hpp"
#include <cctype>
#include <charconv>
#include <stdexcept>

static std::uint64_t mask(std::uint64_t value, std::size_t width){
    return value & ((std::uint64_t{1} << width) - 1);
}

template<typename T>
static bool hex_group(std::string_view str, std::size_t pos, std::size_t len, T& value){
    for(std::size_t i = pos; i < pos + len; ++i){
        if(!std::isxdigit(static_cast<unsigned char>(str[i]))){
            return false;
        }
    }
    std::from_chars_result res = std::from_chars(str.data() + pos, str.data() + pos + len, value, 16);
    return (res.ec == std::errc{} && res.ptr == str.data() + pos + len);
}

namespace UUID{
    /*UUID.Field*/
    std::string Field::bits() const {
        return codec::align_number(value, width, 2);
    }

    std::string Field::hex() const {
        return codec::align_number(value, width/4, 16);
    }

    /*UUID*/
    Uuid::Uuid(
        std::uint64_t time_low,
        std::uint64_t time_mid,
        std::uint64_t time_hi_and_version,
        std::uint64_t clock_seq_hi_and_reserved,
        std::uint64_t clock_seq_low,
        std::uint64_t node
    ) : fields_{
            mask(time_low, field_widths[0]),
            mask(time_mid, field_widths[1]),
            mask(time_hi_and_version, field_widths[2]),
            mask(clock_seq_hi_and_reserved, field_widths[3]),
            mask(clock_seq_low, field_widths[4]),
            mask(node, field_widths[5])
        }
    {}

    Field Uuid::field(std::size_t idx) const {
        if(idx >= num_fields){
            throw std::out_of_range("Uuid::field: index out of range");
        }
        return (*this)[idx];
    }

    Field Uuid::field(std::string_view name) const {
        for(std::size_t i=0; i < num_fields; ++i){
            if(field_names[i] == name){
                return (*this)[i];
            }
        }
        throw std::out_of_range("Uuid::field: unknown field name");
    }

    std::string Uuid::bit_string() const {
        std::string bits;
        bits.reserve(128);
        for(std::size_t i=0; i < num_fields; ++i){
            bits += (*this)[i].bits();
        }
        return bits;
    }

    std::string Uuid::hex_string() const {
        std::string hex;
        hex.reserve(string_length);
        hex += (*this)[0].hex();
        hex += '-';
        hex += (*this)[1].hex();
        hex += '-';
        hex += (*this)[2].hex();
        hex += '-';
        // clock_seq_hi_and_reserved and clock_seq_low share a group.
        hex += (*this)[3].hex();
        hex += (*this)[4].hex();
        hex += '-';
        hex += (*this)[5].hex();
        return hex;
    }

    bool Uuid::equals(const Uuid& other) const {
        for(std::size_t i=0; i < num_fields; ++i){
            if(fields_[i] != other.fields_[i]){
                return false;
            }
        }
        return true;
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        return lhs.equals(rhs);
    }

    bool operator!=(const Uuid& lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    std::ostream& operator<<(std::ostream& os, const Uuid& uuid){
        os << uuid.str();
        return os;
    }

    std::istream& operator>>(std::istream& is, Uuid& uuid){
        char buf[Uuid::string_length] = {};
        is.read(buf, Uuid::string_length);
        if(is.gcount() != static_cast<std::streamsize>(Uuid::string_length)){
            std::cerr << "uuid.cpp:117:uuid extraction failed: short read." << std::endl;
            is.setstate(std::ios_base::failbit);
            return is;
        }
        std::optional<Uuid> tmp = parse(std::string_view(buf, Uuid::string_length));
        if(!tmp){
            std::cerr << "uuid.cpp:123:uuid extraction failed: malformed uuid string." << std::endl;
            is.setstate(std::ios_base::failbit);
            return is;
        }
        uuid = *tmp;
        return is;
    }

    std::optional<Uuid> parse(std::string_view str){
        if(str.size() != Uuid::string_length){
            return std::nullopt;
        }
        if(str[8] != '-' || str[13] != '-' || str[18] != '-' || str[23] != '-'){
            return std::nullopt;
        }
        std::uint32_t time_low = 0;
        std::uint16_t time_mid = 0;
        std::uint16_t time_hi_and_version = 0;
        std::uint8_t clock_seq_hi_and_reserved = 0;
        std::uint8_t clock_seq_low = 0;
        std::uint64_t node = 0;
        if(!hex_group(str, 0, 8, time_low)
            || !hex_group(str, 9, 4, time_mid)
            || !hex_group(str, 14, 4, time_hi_and_version)
            || !hex_group(str, 19, 2, clock_seq_hi_and_reserved)
            || !hex_group(str, 21, 2, clock_seq_low)
            || !hex_group(str, 24, 12, node))
        {
            return std::nullopt;
        }
        return Uuid(
            time_low,
            time_mid,
            time_hi_and_version,
            clock_seq_hi_and_reserved,
            clock_seq_low,
            node
        );
    }
}// uuid namespace
