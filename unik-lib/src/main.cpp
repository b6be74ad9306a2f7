#include "../tests/uuid/uuid-tests.hpp"
#include "../tests/clock-seq/clock-seq-tests.hpp"
#include "../tests/rfc4122/rfc4122-tests.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

static int failures = 0;

static void report(const std::string& name, bool passed){
    if(passed){
        std::cout << name << " test passed." << std::endl;
    } else {
        std::cerr << name << " test failed." << std::endl;
        ++failures;
    }
}

int main(int argc, char* argv[]){
    {
        // UUID tests.
        using namespace tests;
        report("Default uuid", Uuid());
        report("Uuid from bytes", Uuid(Uuid::test_from_bytes));
        report("Uuid truncated buffer", Uuid(Uuid::test_truncated_buffer));
        report("Uuid byte round trip", Uuid(Uuid::test_byte_round_trip));
        report("Uuid field mapping", Uuid(Uuid::test_field_mapping));
        report("Uuid namespaces", Uuid(Uuid::test_namespaces));
        report("Uuid format", Uuid(Uuid::test_format));
        report("Uuid streams", Uuid(Uuid::test_streams));
    }
    {
        // Layout tests.
        using namespace tests;
        report("Layout parse versions", Layout(Layout::test_parse_versions));
        report("Layout parse compact", Layout(Layout::test_parse_compact));
        report("Layout parse length", Layout(Layout::test_parse_length));
        report("Layout parse characters", Layout(Layout::test_parse_characters));
        report("Layout variant normalized", Layout(Layout::test_variant_normalized));
        report("Layout unrecognized version", Layout(Layout::test_unrecognized_version));
        report("Layout variant prefix", Layout(Layout::test_variant_prefix));
        report("Layout stamp", Layout(Layout::test_stamp));
    }
    {
        // Clock sequence tests.
        using namespace tests;
        report("Clock sequence sequential", ClockSeq(ClockSeq::test_sequential));
        report("Clock sequence concurrent", ClockSeq(ClockSeq::test_concurrent, 8, 2048));
    }
    {
        // Generator tests.
        using namespace tests;
        report("Timestamp truncation", Timestamp(Timestamp::test_truncation));
        report("Timestamp epoch", Timestamp(Timestamp::test_epoch));
        report("Node random", Node(Node::test_random));
        report("Node hardware", Node(Node::test_hardware));
        report("Generator stamping", Rfc4122(Rfc4122::test_stamping));
        report("Generator layout round trip", Rfc4122(Rfc4122::test_layout_round_trip));
        report("Time based generator", Rfc4122(Rfc4122::test_time_based));
        report("DCE generator", Rfc4122(Rfc4122::test_dce));
        report("Name based generators", Rfc4122(Rfc4122::test_name_based));
        report("Random generator", Rfc4122(Rfc4122::test_random));
        report("Uuid constructors", Rfc4122(Rfc4122::test_uuid_constructors));
    }
    return (failures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
