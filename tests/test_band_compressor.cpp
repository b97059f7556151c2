#include <doctest/doctest.h>

#include "quantile_summary/band_compressor.hpp"
#include "test_helpers.hpp"

#include <vector>

TEST_CASE("gk_band table") {
    // bands[p][delta] for 0 <= delta <= p
    const std::vector<std::vector<uint64_t>> bands = {
        {0},
        {1, 0},
        {2, 1, 0},
        {2, 1, 1, 0},
        {3, 2, 2, 1, 0},
        {3, 2, 2, 1, 1, 0},
        {3, 2, 2, 2, 2, 1, 0},
        {3, 2, 2, 2, 2, 1, 1, 0},
        {4, 3, 3, 3, 3, 2, 2, 1, 0},
        {4, 3, 3, 3, 3, 2, 2, 1, 1, 0},
        {4, 3, 3, 3, 3, 2, 2, 2, 2, 1, 0},
        {4, 3, 3, 3, 3, 2, 2, 2, 2, 1, 1, 0},
        {4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 1, 0},
        {4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 1, 1, 0},
        {4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 2, 2, 1, 0},
        {4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 2, 2, 1, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 2, 2, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 2, 2, 1, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 2, 2, 2, 2, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 2, 2, 2, 2, 1, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 1, 1, 0},
        {5, 4, 4, 4, 4, 4, 4, 4, 4, 3, 3, 3, 3, 3, 3, 3, 3, 2, 2, 2, 2, 1, 0},
    };

    for (uint64_t p = 0; p < bands.size(); ++p) {
        for (uint64_t delta = 0; delta <= p; ++delta) {
            INFO("p = " << p << ", delta = " << delta);
            CHECK(gk_band(delta, p) == bands[p][delta]);
        }
    }
}

TEST_CASE("BandCompressor folds runs of exact entries into their right neighbour") {
    // n = 8, epsilon = 0.25 -> p = 4
    auto entries = make_entries<int>({1, 2, 3, 4, 5, 6, 7, 8}, {1, 1, 1, 1, 1, 1, 1, 1}, {0, 0, 0, 0, 0, 0, 0, 0});
    BandCompressor<int> compressor(4);

    CHECK(compressor.compress(entries) == 5);
    CHECK(entries == make_entries<int>({1, 4, 8}, {1, 3, 4}, {0, 0, 0}));

    // Nothing left to fold
    CHECK(compressor.compress(entries) == 0);
    CHECK(entries == make_entries<int>({1, 4, 8}, {1, 3, 4}, {0, 0, 0}));
}

TEST_CASE("BandCompressor keeps an entry whose fold would exceed p") {
    // p = 2: delta 1 is band 1, delta 0 is band 2
    auto entries = make_entries<int>({1, 2, 3, 4}, {1, 1, 1, 1}, {0, 1, 1, 0});
    BandCompressor<int> compressor(2);

    CHECK(compressor.compress(entries) == 1);
    CHECK(entries == make_entries<int>({1, 2, 4}, {1, 1, 2}, {0, 1, 0}));
}

TEST_CASE("BandCompressor leaves short sequences alone") {
    auto entries = make_entries<int>({1, 2}, {1, 1}, {0, 0});
    CHECK(BandCompressor<int>(10).compress(entries) == 0);
    CHECK(entries.size() == 2);
}
