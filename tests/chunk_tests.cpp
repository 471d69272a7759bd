// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <surge/core/chunk.hpp>
#include <surge/core/config.hpp>

using namespace surge::core;

namespace {

// Contiguous, non-overlapping, covering [0, size)
void check_plan(const std::vector<ChunkRange>& plan, std::uint64_t size) {
    REQUIRE(!plan.empty());
    CHECK(plan.front().first == 0);
    CHECK(plan.back().last == size - 1);

    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        CHECK(plan[i].index == i);
        CHECK(plan[i].first <= plan[i].last);
        if (i > 0) {
            CHECK(plan[i].first == plan[i - 1].last + 1);
        }
        sum += plan[i].size();
    }
    CHECK(sum == size);
}

} // namespace

TEST_CASE("worker_count_for tiers", "[chunk]") {
    SECTION("Size thresholds") {
        CHECK(worker_count_for(200 * MiB, true) == 24);
        CHECK(worker_count_for(100 * MiB + 1, true) == 24);
        CHECK(worker_count_for(100 * MiB, true) == 16);
        CHECK(worker_count_for(60 * MiB, true) == 16);
        CHECK(worker_count_for(50 * MiB, true) == 8);
        CHECK(worker_count_for(20 * MiB, true) == 8);
        CHECK(worker_count_for(10 * MiB, true) == 1);
        CHECK(worker_count_for(1024, true) == 1);
    }

    SECTION("No ranges or unknown size means one stream") {
        CHECK(worker_count_for(500 * MiB, false) == 1);
        CHECK(worker_count_for(0, true) == 1);
    }
}

TEST_CASE("plan_chunks splits exactly", "[chunk]") {
    SECTION("150 MiB over 24 workers") {
        constexpr std::uint64_t size = 157'286'400;
        auto plan = plan_chunks(size, 24);
        REQUIRE(plan.size() == 24);
        check_plan(plan, size);
        CHECK(plan[0].size() == size / 24);
    }

    SECTION("Remainder goes to the last chunk") {
        auto plan = plan_chunks(1003, 4);
        REQUIRE(plan.size() == 4);
        check_plan(plan, 1003);
        CHECK(plan[0] == ChunkRange{0, 0, 249});
        CHECK(plan[3] == ChunkRange{3, 750, 1002});
        CHECK(plan[3].size() == 253);
    }

    SECTION("Odd sizes") {
        const std::uint64_t sizes[] = {1, 7, 999'983, 10 * MiB + 17};
        const std::uint32_t counts[] = {1, 3, 8, 16, 24};
        for (auto size : sizes) {
            for (auto workers : counts) {
                check_plan(plan_chunks(size, workers), size);
            }
        }
    }

    SECTION("More workers than bytes") {
        auto plan = plan_chunks(5, 24);
        CHECK(plan.size() == 5);
        check_plan(plan, 5);
    }

    SECTION("Empty file has no chunks") {
        CHECK(plan_chunks(0, 8).empty());
    }

    SECTION("Deterministic") {
        CHECK(plan_chunks(123'456'789, 16) == plan_chunks(123'456'789, 16));
    }
}
