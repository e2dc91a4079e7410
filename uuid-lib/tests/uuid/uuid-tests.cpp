#include "uuid-tests.hpp"
#include <sstream>
#include <stdexcept>

namespace tests{
    Uuid::Uuid()
      : passed_{false},
        uuid_()
    {
        for(std::size_t i=0; i < UUID::Uuid::num_fields; ++i){
            if(uuid_[i].value != 0){
                return;
            }
        }
        if(uuid_.str() != "00000000-0000-0000-0000-000000000000"){
            return;
        }
        if(uuid_.version() != 0){
            return;
        }
        passed_ = true;
        return;
    }

    Uuid::Uuid(Uuid::ParseFields)
      : passed_{false},
        uuid_()
    {
        const std::string str("12345678-1234-5678-9abc-123456789012");
        std::optional<UUID::Uuid> parsed = UUID::parse(str);
        if(!parsed){
            return;
        }
        uuid_ = *parsed;
        if(uuid_.time_low() != 0x12345678
            || uuid_.time_mid() != 0x1234
            || uuid_.time_hi_and_version() != 0x5678
            || uuid_.clock_seq_hi_and_reserved() != 0x9a
            || uuid_.clock_seq_low() != 0xbc
            || uuid_.node() != 0x123456789012)
        {
            return;
        }
        if(uuid_.version() != 5){
            return;
        }
        if(uuid_.str() != str){
            return;
        }

        // Upper case input is accepted, output is always lower case.
        parsed = UUID::parse("ABCDEF01-23AB-4CDE-8F01-ABCDEF012345");
        if(!parsed || parsed->str() != "abcdef01-23ab-4cde-8f01-abcdef012345"){
            return;
        }
        parsed = UUID::parse("ffffffff-ffff-ffff-ffff-ffffffffffff");
        if(!parsed || parsed->node() != 0xFFFFFFFFFFFF || parsed->time_low() != 0xFFFFFFFF){
            return;
        }
        passed_ = true;
    }

    Uuid::Uuid(Uuid::ParseRejection)
      : passed_{false},
        uuid_()
    {
        const char* malformed[] = {
            "not-a-uuid",
            "",
            "1234567-1234-5678-9abc-123456789012",   // 7 digit first group.
            "123456789-1234-5678-9abc-12345678901",  // 9 digit first group.
            "12345678-1234-5678-9abc-1234567890123", // too long.
            "12345678-1234-5678-9a-bc123456789012",  // misplaced hyphen.
            "12345678-1234-5678-9abc-12345678901g",  // non-hex.
            "12345678_1234_5678_9abc_123456789012",  // wrong separator.
            "12345678123456789abc123456789012",      // no hyphens.
            "+2345678-1234-5678-9abc-123456789012",  // sign.
            " 12345678-1234-5678-9abc-12345678901",  // leading space.
        };
        for(const char* str : malformed){
            if(UUID::parse(str)){
                return;
            }
        }
        passed_ = true;
    }

    Uuid::Uuid(Uuid::Equality)
      : passed_{false},
        uuid_(0x12345678, 0x1234, 0x5678, 0x9a, 0xbc, 0x123456789012)
    {
        UUID::Uuid same(0x12345678, 0x1234, 0x5678, 0x9a, 0xbc, 0x123456789012);
        if(!uuid_.equals(same) || uuid_ != same){
            return;
        }
        const UUID::Uuid changed[] = {
            UUID::Uuid(0x12345679, 0x1234, 0x5678, 0x9a, 0xbc, 0x123456789012),
            UUID::Uuid(0x12345678, 0x1235, 0x5678, 0x9a, 0xbc, 0x123456789012),
            UUID::Uuid(0x12345678, 0x1234, 0x5679, 0x9a, 0xbc, 0x123456789012),
            UUID::Uuid(0x12345678, 0x1234, 0x5678, 0x9b, 0xbc, 0x123456789012),
            UUID::Uuid(0x12345678, 0x1234, 0x5678, 0x9a, 0xbd, 0x123456789012),
            UUID::Uuid(0x12345678, 0x1234, 0x5678, 0x9a, 0xbc, 0x123456789013),
        };
        for(const UUID::Uuid& other : changed){
            if(uuid_.equals(other) || uuid_ == other){
                return;
            }
        }
        passed_ = true;
    }

    Uuid::Uuid(Uuid::Masking)
      : passed_{false},
        uuid_(0x1FFFFFFFF, 0x1FFFF, 0x12345, 0x1AB, 0x2CD, 0xF123456789012)
    {
        if(uuid_.time_low() != 0xFFFFFFFF
            || uuid_.time_mid() != 0xFFFF
            || uuid_.time_hi_and_version() != 0x2345
            || uuid_.clock_seq_hi_and_reserved() != 0xAB
            || uuid_.clock_seq_low() != 0xCD
            || uuid_.node() != 0x123456789012)
        {
            return;
        }
        for(std::size_t i=0; i < UUID::Uuid::num_fields; ++i){
            UUID::Field field = uuid_[i];
            if(field.value >= (std::uint64_t{1} << field.width)){
                return;
            }
            if(field.hex().size() != field.width/4 || field.bits().size() != field.width){
                return;
            }
        }
        if(uuid_.str() != "ffffffff-ffff-2345-abcd-123456789012"){
            return;
        }
        passed_ = true;
    }

    Uuid::Uuid(Uuid::FieldAccess)
      : passed_{false},
        uuid_(0x12345678, 0x1234, 0x5678, 0x9a, 0xbc, 0x123456789012)
    {
        for(std::size_t i=0; i < UUID::Uuid::num_fields; ++i){
            UUID::Field by_idx = uuid_.field(i);
            UUID::Field by_name = uuid_.field(UUID::Uuid::field_names[i]);
            if(by_idx.value != by_name.value || by_idx.width != UUID::Uuid::field_widths[i]){
                return;
            }
        }
        UUID::Field seq_hi = uuid_.field("clock_seq_hi_and_reserved");
        if(seq_hi.value != 0x9a || seq_hi.hex() != "9a" || seq_hi.bits() != "10011010"){
            return;
        }
        UUID::Field mid = uuid_.field(1);
        if(mid.hex() != "1234" || mid.bits() != "0001001000110100"){
            return;
        }
        if(uuid_.field("node").hex() != "123456789012"){
            return;
        }
        try{
            uuid_.field(UUID::Uuid::num_fields);
            return;
        } catch(const std::out_of_range&){}
        try{
            uuid_.field("timeLow");
            return;
        } catch(const std::out_of_range&){}
        passed_ = true;
    }

    Uuid::Uuid(Uuid::BitString)
      : passed_{false},
        uuid_(0x80000001, 0, 0xFFFF, 0x01, 0x80, 1)
    {
        std::string bits = uuid_.bit_string();
        if(bits.size() != 128){
            return;
        }
        std::string expected;
        expected += "10000000000000000000000000000001";
        expected += std::string(16, '0');
        expected += std::string(16, '1');
        expected += "00000001";
        expected += "10000000";
        expected += std::string(47, '0') + "1";
        if(bits != expected){
            return;
        }
        std::string concatenated;
        for(std::size_t i=0; i < UUID::Uuid::num_fields; ++i){
            concatenated += uuid_[i].bits();
        }
        if(concatenated != bits){
            return;
        }
        passed_ = true;
    }

    Uuid::Uuid(Uuid::StreamInsertion)
      : passed_{false},
        uuid_(0xabc, 0x1, 0x4000, 0x80, 0x7, 0xdef)
    {
        std::stringstream ss;
        ss << uuid_;
        if(ss.str() != "00000abc-0001-4000-8007-000000000def"){
            return;
        }
        if(uuid_.hex_string() != ss.str()){
            return;
        }
        passed_ = true;
    }

    Uuid::Uuid(Uuid::StreamExtraction)
      : passed_{false},
        uuid_()
    {
        std::stringstream ss("12345678-1234-5678-9abc-123456789012 00000abc-0001-4000-8007-000000000def");
        ss >> uuid_;
        if(!ss || uuid_.str() != "12345678-1234-5678-9abc-123456789012"){
            return;
        }
        ss.get(); // skip the separator.
        ss >> uuid_;
        if(!ss || uuid_.str() != "00000abc-0001-4000-8007-000000000def"){
            return;
        }

        UUID::Uuid untouched(1, 2, 3, 4, 5, 6);
        std::stringstream bad("12345678-1234-5678-9abc-12345678901z");
        bad >> untouched;
        if(!bad.fail() || untouched != UUID::Uuid(1, 2, 3, 4, 5, 6)){
            return;
        }

        std::stringstream short_read("12345678-1234");
        short_read >> untouched;
        if(!short_read.fail() || untouched != UUID::Uuid(1, 2, 3, 4, 5, 6)){
            return;
        }
        passed_ = true;
    }
}
