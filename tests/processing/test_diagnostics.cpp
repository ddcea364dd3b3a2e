#include <catch2/catch_test_macros.hpp>
#include "processing/Diagnostics.hpp"

using processing::Diagnostics;

TEST_CASE("Diagnostics - preview", "[diagnostics]")
{
    Diagnostics::SetMaxPreview(160);

    SECTION("Short text is kept") {
        REQUIRE(Diagnostics::Preview("// [tag:x]") == "// [tag:x]");
    }

    SECTION("Tabs and control characters are made visible") {
        REQUIRE(Diagnostics::Preview("a\tb") == "a\\tb");
        REQUIRE(Diagnostics::Preview(std::string("a\x01" "b")) == "a?b");
    }

    SECTION("Long text is truncated") {
        Diagnostics::SetMaxPreview(4);
        REQUIRE(Diagnostics::Preview("abcdefgh") == "abcd... (8 bytes)");
        Diagnostics::SetMaxPreview(160);
    }

    SECTION("Zero limit is clamped") {
        Diagnostics::SetMaxPreview(0);
        REQUIRE(Diagnostics::MaxPreview() == 1);
        Diagnostics::SetMaxPreview(160);
    }
}

TEST_CASE("Diagnostics - location", "[diagnostics]")
{
    REQUIRE(Diagnostics::Location("src/main.rs", 12) == "src/main.rs:12");
}
