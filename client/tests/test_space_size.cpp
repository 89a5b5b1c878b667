#include <lest/lest.hpp>

#define CASE(name) lest_CASE(specification(), name)
extern lest::tests& specification();

#include "strata/core/conf/SpaceSize.hpp"

using namespace sta::conf;

CASE(
    "Plain and suffixed sizes"
    "[SpaceSize]")
{
    EXPECT(parse_space_size("512").value() == 512);
    EXPECT(parse_space_size("0").value() == 0);
    EXPECT(parse_space_size("10B").value() == 10);
    EXPECT(parse_space_size("1KB").value() == 1024);
    EXPECT(parse_space_size("1k").value() == 1024);
    EXPECT(parse_space_size("8MB").value() == 8 * MB);
    EXPECT(parse_space_size("8mb").value() == 8 * MB);
    EXPECT(parse_space_size("2GB").value() == 2 * GB);
    EXPECT(parse_space_size("1TB").value() == TB);
    EXPECT(parse_space_size("1pb").value() == PB);
}

CASE(
    "Fractions and whitespace"
    "[SpaceSize]")
{
    EXPECT(parse_space_size("1.5 kb").value() == 1536);
    EXPECT(parse_space_size("  4 MB  ").value() == 4 * MB);
    EXPECT(parse_space_size("0.5B").value() == 0);
}

CASE(
    "Malformed sizes are rejected"
    "[SpaceSize]")
{
    for (const char* text : {"", "MB", "-1MB", "12XB", "1.2.3KB", "abc", "99999999PB"}) {
        auto size = parse_space_size(text);
        EXPECT_NOT(size.has_value());
        if (!size) {
            EXPECT(size.error().code() == sta::ErrorCode::InvalidConfig);
        }
    }
}

CASE(
    "Formatting picks the largest unit"
    "[SpaceSize]")
{
    EXPECT(format_space_size(100) == "100B");
    EXPECT(format_space_size(1536) == "1.50KB");
    EXPECT(format_space_size(8 * MB) == "8.00MB");
}
