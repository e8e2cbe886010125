// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangedl/core/range_planner.hpp>

using namespace rangedl::core;

TEST_CASE("plan_ranges - even split", "[planner]") {
    auto plan = plan_ranges(1000, 4);
    REQUIRE(plan.has_value());
    REQUIRE(plan->size() == 4);

    CHECK((*plan)[0] == ChunkRange{0, 0, 250});
    CHECK((*plan)[1] == ChunkRange{1, 250, 250});
    CHECK((*plan)[2] == ChunkRange{2, 500, 250});
    CHECK((*plan)[3] == ChunkRange{3, 750, 250});
    CHECK((*plan)[3].end() == 999);
}

TEST_CASE("plan_ranges - remainder goes to the last chunk", "[planner]") {
    auto plan = plan_ranges(1003, 4);
    REQUIRE(plan.has_value());
    REQUIRE(plan->size() == 4);
    CHECK((*plan)[0].length == 250);
    CHECK((*plan)[2].length == 250);
    CHECK((*plan)[3].start == 750);
    CHECK((*plan)[3].length == 253);
    CHECK((*plan)[3].end() == 1002);
}

TEST_CASE("plan_ranges - edge cases", "[planner]") {
    SECTION("Zero-sized resource") {
        auto plan = plan_ranges(0, 4);
        REQUIRE(plan.has_value());
        REQUIRE(plan->size() == 1);
        CHECK((*plan)[0] == ChunkRange{0, 0, 0});
        CHECK((*plan)[0].empty());
    }

    SECTION("Single worker takes everything") {
        auto plan = plan_ranges(12345, 1);
        REQUIRE(plan.has_value());
        REQUIRE(plan->size() == 1);
        CHECK((*plan)[0] == ChunkRange{0, 0, 12345});
    }

    SECTION("Fewer bytes than workers") {
        auto plan = plan_ranges(3, 4);
        REQUIRE(plan.has_value());
        REQUIRE(plan->size() == 4);
        CHECK((*plan)[0].length == 0);
        CHECK((*plan)[3].start == 0);
        CHECK((*plan)[3].length == 3);
    }

    SECTION("No clamping of large worker counts") {
        auto plan = plan_ranges(1'000'000, 64);
        REQUIRE(plan.has_value());
        CHECK(plan->size() == 64);
    }

    SECTION("Non-positive worker count") {
        auto zero = plan_ranges(1000, 0);
        REQUIRE(!zero.has_value());
        CHECK(zero.error() == DownloadErrc::invalid_argument);

        auto negative = plan_ranges(1000, -3);
        REQUIRE(!negative.has_value());
        CHECK(negative.error() == DownloadErrc::invalid_argument);
    }
}

TEST_CASE("plan_ranges - ranges tile the resource", "[planner]") {
    auto size = GENERATE(as<std::uint64_t>{}, 16, 17, 1024, 1'048'577, 10'000'019, 5'000'000'000ULL);
    auto workers = GENERATE(as<std::int64_t>{}, 1, 2, 3, 4, 7, 16);

    auto plan = plan_ranges(size, workers);
    REQUIRE(plan.has_value());
    REQUIRE(plan->size() == static_cast<std::size_t>(workers));

    std::uint64_t next = 0;
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < plan->size(); ++i) {
        const auto& r = (*plan)[i];
        CHECK(r.index == i);
        CHECK(r.start == next);
        CHECK(r.length >= size / static_cast<std::uint64_t>(workers));
        next = r.start + r.length;
        sum += r.length;
    }
    CHECK(sum == size);
    CHECK(plan->back().end() == size - 1);
}
