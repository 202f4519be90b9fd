// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <vault/stream/range.hpp>

using namespace vault::stream;
using vault::core::VaultErrc;

TEST_CASE("parse_range - satisfiable forms", "[range]") {
    SECTION("start-end") {
        auto r = parse_range("bytes=0-1023", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{0, 1023});
        CHECK(r->length() == 1024);
    }

    SECTION("start-") {
        auto r = parse_range("bytes=1024-", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{1024, 2047});
    }

    SECTION("-suffix") {
        auto r = parse_range("bytes=-500", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{1548, 2047});
    }

    SECTION("Suffix longer than the resource starts at zero") {
        auto r = parse_range("bytes=-5000", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{0, 2047});
    }

    SECTION("End past EOF is clamped") {
        auto r = parse_range("bytes=1000-999999", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{1000, 2047});
    }

    SECTION("Single byte") {
        auto r = parse_range("bytes=0-0", 2048);
        REQUIRE(r.has_value());
        CHECK(r->length() == 1);
    }

    SECTION("Last byte") {
        auto r = parse_range("bytes=2047-", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{2047, 2047});
    }

    SECTION("Surrounding whitespace") {
        auto r = parse_range("  bytes=10-20 ", 2048);
        REQUIRE(r.has_value());
        CHECK(*r == ByteRange{10, 20});
    }
}

TEST_CASE("parse_range - unsatisfiable forms", "[range]") {
    auto invalid = [](std::string_view header, std::uint64_t size) {
        auto r = parse_range(header, size);
        return !r.has_value() && r.error().is(VaultErrc::invalid_range);
    };

    CHECK(invalid("bytes=2048-", 2048));        // start == size
    CHECK(invalid("bytes=5000-6000", 2048));    // start past EOF
    CHECK(invalid("bytes=100-50", 2048));       // start > end
    CHECK(invalid("bytes=-0", 2048));           // empty suffix
    CHECK(invalid("bytes=0-10,20-30", 2048));   // multiple ranges
    CHECK(invalid("bytes=abc-def", 2048));
    CHECK(invalid("bytes=-", 2048));
    CHECK(invalid("bytes=10", 2048));
    CHECK(invalid("items=0-10", 2048));
    CHECK(invalid("", 2048));
    CHECK(invalid("bytes=0-", 0));              // empty resource
    CHECK(invalid("bytes=99999999999999999999999-", 2048));  // overflow
}

TEST_CASE("is_partial", "[range]") {
    CHECK(!is_partial(ByteRange{0, 2047}, 2048));
    CHECK(is_partial(ByteRange{0, 0}, 2048));
    CHECK(is_partial(ByteRange{1, 2047}, 2048));
    CHECK(is_partial(ByteRange{0, 2046}, 2048));
}
