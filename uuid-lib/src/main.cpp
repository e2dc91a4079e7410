#include "../tests/codec/codec-tests.hpp"
#include "../tests/uuid/uuid-tests.hpp"
#include "../tests/generators/generators-tests.hpp"
#include "../tests/json/uuid-json-tests.hpp"
#include <cstdlib>
#include <iostream>

static std::size_t failures = 0;

template<typename Test>
static void report(const char* suite, std::size_t& test_num, Test&& test){
    if(test){
        std::cout << suite << " test " << test_num << " passed." << std::endl;
    } else {
        std::cerr << suite << " test " << test_num << " failed." << std::endl;
        ++failures;
    }
    ++test_num;
}

int main(int argc, char* argv[]){
    {
        // Codec tests.
        using namespace tests;
        std::size_t test_num = 1;
        report("Codec", test_num, CodecTests(CodecTests::test_random_width));
        report("Codec", test_num, CodecTests(CodecTests::test_random_composed_width));
        report("Codec", test_num, CodecTests(CodecTests::test_random_width_rejection));
        report("Codec", test_num, CodecTests(CodecTests::test_align_number));
    }
    {
        // UUID tests.
        using namespace tests;
        std::size_t test_num = 1;
        report("Uuid", test_num, Uuid());
        report("Uuid", test_num, Uuid(Uuid::test_parse_fields));
        report("Uuid", test_num, Uuid(Uuid::test_parse_rejection));
        report("Uuid", test_num, Uuid(Uuid::test_equality));
        report("Uuid", test_num, Uuid(Uuid::test_masking));
        report("Uuid", test_num, Uuid(Uuid::test_field_access));
        report("Uuid", test_num, Uuid(Uuid::test_bit_string));
        report("Uuid", test_num, Uuid(Uuid::test_stream_insertion));
        report("Uuid", test_num, Uuid(Uuid::test_stream_extraction));
    }
    {
        // Generator tests.
        using namespace tests;
        std::size_t test_num = 1;
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_v4));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_v4_string));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_v1));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_initial_state));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_time_fields));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_clock_regression));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_same_millisecond));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_tick_exhaustion));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_concurrent_callers));
        report("Generator", test_num, GeneratorsTests(GeneratorsTests::test_forward_clock_callers));
    }
    {
        // JSON tests.
        using namespace tests;
        std::size_t test_num = 1;
        report("Json", test_num, UuidJsonTests(UuidJsonTests::test_value_from));
        report("Json", test_num, UuidJsonTests(UuidJsonTests::test_value_to));
        report("Json", test_num, UuidJsonTests(UuidJsonTests::test_describe));
    }
    return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
