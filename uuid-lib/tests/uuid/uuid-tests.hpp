#ifndef UUID_TESTS_HPP
#define UUID_TESTS_HPP
#include "../../src/uuid/uuid.hpp"
namespace tests{
    class Uuid
    {
    public:
        constexpr static struct ParseFields{} test_parse_fields{};
        constexpr static struct ParseRejection{} test_parse_rejection{};
        constexpr static struct Equality{} test_equality{};
        constexpr static struct Masking{} test_masking{};
        constexpr static struct FieldAccess{} test_field_access{};
        constexpr static struct BitString{} test_bit_string{};
        constexpr static struct StreamInsertion{} test_stream_insertion{};
        constexpr static struct StreamExtraction{} test_stream_extraction{};

        Uuid(); // Default tests.
        explicit Uuid(ParseFields);
        explicit Uuid(ParseRejection);
        explicit Uuid(Equality);
        explicit Uuid(Masking);
        explicit Uuid(FieldAccess);
        explicit Uuid(BitString);
        explicit Uuid(StreamInsertion);
        explicit Uuid(StreamExtraction);

        operator bool(){ return passed_; }
    private:
        bool passed_;
        UUID::Uuid uuid_;
    };
}
#endif
