#include <doctest/doctest.h>

#include "generator/quantile_generator.hpp"
#include "quantile_summary/gk_summary.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <limits>
#include <vector>

TEST_CASE("modified insertion folds into the right neighbour") {
    GKSummary<int> s(0.2, CompressionStrategy::MODIFIED);
    const std::vector<int> values = {8, 6, 0, 4, 3, 9, 2, 5, 1, 7};
    const std::vector<std::vector<Entry<int>>> expected = {
        make_entries<int>({8}, {1}, {0}),
        make_entries<int>({6, 8}, {1, 1}, {0, 0}),
        make_entries<int>({0, 6, 8}, {1, 1, 1}, {0, 0, 0}),
        make_entries<int>({0, 4, 6, 8}, {1, 1, 1, 1}, {0, 0, 0, 0}),
        make_entries<int>({0, 4, 6, 8}, {1, 2, 1, 1}, {0, 0, 0, 0}),
        make_entries<int>({0, 4, 6, 9}, {1, 2, 1, 2}, {0, 0, 0, 0}),
        make_entries<int>({0, 2, 4, 6, 9}, {1, 1, 2, 1, 2}, {0, 1, 0, 0, 0}),
        make_entries<int>({0, 2, 4, 6, 9}, {1, 1, 2, 2, 2}, {0, 1, 0, 0, 0}),
        make_entries<int>({0, 2, 4, 6, 9}, {1, 2, 2, 2, 2}, {0, 1, 0, 0, 0}),
        make_entries<int>({0, 2, 4, 6, 9}, {1, 2, 2, 2, 3}, {0, 1, 0, 0, 0}),
    };

    for (size_t i = 0; i < values.size(); ++i) {
        s.update(values[i]);
        INFO("after inserting " << values[i]);
        CHECK(s.get_entries() == expected[i]);
    }
    CHECK(s.get_n() == 10);

    s.compress();
    CHECK(s.get_entries() == make_entries<int>({0, 4, 6, 9}, {1, 4, 2, 3}, {0, 0, 0, 0}));

    SUBCASE("queries pick the entry with the smallest worst-case error") {
        // {target rank, value, error in ranks}
        const std::vector<std::vector<int>> answers = {{1, 0, 0}, {2, 0, 1}, {3, 0, 2}, {4, 4, 1}, {5, 4, 0},
                                                       {6, 4, 1}, {7, 6, 0}, {8, 6, 1}, {9, 9, 1}, {10, 9, 0}};
        for (const auto &answer : answers) {
            INFO("target rank " << answer[0]);
            auto [value, error] = s.get_quantile_with_error(phi_for_rank(answer[0], 10));
            CHECK(value == answer[1]);
            CHECK(error == doctest::Approx(answer[2] / 10.0));
        }
    }
}

TEST_CASE("classical insertion is exact until the first compression") {
    GKSummary<int> s(0.001, CompressionStrategy::CLASSICAL);
    for (int i = 0; i < 20; ++i) s.update(i);

    REQUIRE(s.get_num_retained() == 20);
    for (const auto &entry : s.get_entries()) {
        CHECK(entry.g == 1);
        CHECK(entry.delta == 0);
    }
    for (int i = 0; i < 20; ++i) CHECK(s.get_quantile(phi_for_rank(i + 1, 20)) == i);
}

TEST_CASE("classical interior entries take floor(2 eps n) - 1 once compaction started") {
    // Compression period is ceil(1 / (2 * 0.25)) = 2 insertions
    GKSummary<int> s(0.25, CompressionStrategy::CLASSICAL);
    s.update(0);
    s.update(9);
    s.update(5); // compresses first, then n = 3 and the cap is 1
    s.update(3); // n = 4, cap 2

    CHECK(s.get_num_compressions() == 1);
    CHECK(s.get_entries() == make_entries<int>({0, 3, 5, 9}, {1, 1, 1, 1}, {0, 1, 0, 0}));
}

TEST_CASE("classical query on a hand built summary") {
    // 20 values represented by 7 entries, max g + delta = 5 = 2 * eps * n
    auto s = GKSummary<int>::from_entries(5.0 / 40.0, CompressionStrategy::CLASSICAL,
                                          make_entries<int>({1, 2, 4, 7, 11, 16, 20}, {1, 1, 2, 3, 4, 5, 4}, {0, 0, 0, 0, 0, 0, 0}));
    REQUIRE(s.get_n() == 20);

    const std::vector<int> expected = {1, 2, 2, 4, 4, 7, 7, 7, 7, 11, 11, 11, 11, 16, 16, 16, 16, 16, 20, 20};
    for (uint64_t rank = 1; rank <= 20; ++rank) {
        INFO("target rank " << rank);
        CHECK(s.get_quantile(phi_for_rank(rank, 20)) == expected[rank - 1]);
    }
}

TEST_CASE("compression of a hand built summary") {
    auto entries = make_entries<int>({1, 2, 3, 4, 5, 6, 7, 8}, {1, 1, 1, 1, 1, 1, 1, 1}, {0, 0, 0, 0, 0, 0, 0, 0});

    SUBCASE("classical") {
        auto s = GKSummary<int>::from_entries(0.25, CompressionStrategy::CLASSICAL, entries);
        s.compress();
        CHECK(s.get_entries() == make_entries<int>({1, 4, 8}, {1, 3, 4}, {0, 0, 0}));
    }

    SUBCASE("modified") {
        auto s = GKSummary<int>::from_entries(0.25, CompressionStrategy::MODIFIED, entries);
        s.compress();
        CHECK(s.get_entries() == make_entries<int>({1, 5, 8}, {1, 4, 3}, {0, 0, 0}));
    }
}

TEST_CASE("from_entries rejects unusable entry lists") {
    CHECK_THROWS_AS(GKSummary<int>::from_entries(0.1, CompressionStrategy::MODIFIED, make_entries<int>({2, 1}, {1, 1}, {0, 0})), ConfigurationError);
    CHECK_THROWS_AS(GKSummary<int>::from_entries(0.1, CompressionStrategy::MODIFIED, make_entries<int>({1, 2}, {1, 0}, {0, 0})), ConfigurationError);

    SUBCASE("inexact minimum") {
        CHECK_THROWS_AS(GKSummary<int>::from_entries(0.1, CompressionStrategy::MODIFIED, make_entries<int>({1, 2}, {2, 1}, {0, 0})), ConfigurationError);
        CHECK_THROWS_AS(GKSummary<int>::from_entries(0.1, CompressionStrategy::CLASSICAL, make_entries<int>({1, 2}, {1, 1}, {1, 0})), ConfigurationError);
    }

    SUBCASE("uncertain maximum") {
        CHECK_THROWS_AS(GKSummary<int>::from_entries(0.1, CompressionStrategy::MODIFIED, make_entries<int>({1, 2, 3}, {1, 1, 1}, {0, 0, 1})), ConfigurationError);
    }

    SUBCASE("entry above floor(2 eps n)") {
        // n = 5, bound 1
        CHECK_THROWS_AS(GKSummary<int>::from_entries(0.1, CompressionStrategy::MODIFIED, make_entries<int>({1, 5, 9}, {1, 3, 1}, {0, 0, 0})), ConfigurationError);
        // n = 8, bound 4
        CHECK_THROWS_AS(GKSummary<int>::from_entries(0.25, CompressionStrategy::CLASSICAL, make_entries<int>({1, 4, 8}, {1, 3, 4}, {0, 2, 0})), ConfigurationError);
        CHECK_NOTHROW(GKSummary<int>::from_entries(0.25, CompressionStrategy::CLASSICAL, make_entries<int>({1, 4, 8}, {1, 3, 4}, {0, 1, 0})));
    }
}

TEST_CASE("modified insertion of a new maximum stays within the bound") {
    // n = 10, bound 5. The maximum is folded into only while its g + delta leaves room.
    auto s = GKSummary<int>::from_entries(0.25, CompressionStrategy::MODIFIED, make_entries<int>({1, 5, 9}, {1, 5, 4}, {0, 0, 0}));
    s.update(10); // n = 11, bound 5: 4 + 1 <= 5
    CHECK(s.get_entries() == make_entries<int>({1, 5, 10}, {1, 5, 5}, {0, 0, 0}));
    s.update(11); // n = 12, bound 6: 5 + 1 <= 6
    CHECK(s.get_entries() == make_entries<int>({1, 5, 11}, {1, 5, 6}, {0, 0, 0}));
    s.update(12); // n = 13, bound 6: appended
    CHECK(s.get_entries() == make_entries<int>({1, 5, 11, 12}, {1, 5, 6, 1}, {0, 0, 0, 0}));
    CHECK(respects_g_delta_bound(s));
}

TEST_CASE("realized rank error stays within epsilon * n") {
    for (auto strategy : {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED}) {
        for (double epsilon : {0.1, 0.05, 0.01, 0.002}) {
            for (int64_t n : {1, 2, 3, 10, 100, 1000, 3000}) {
                INFO(to_string(strategy) << " epsilon = " << epsilon << " n = " << n);
                GKSummary<int64_t> s(epsilon, strategy);
                auto values = shuffled_range(n, static_cast<uint64_t>(n) * 31 + 7);
                s.update(values.begin(), values.end());

                REQUIRE(s.get_n() == static_cast<uint64_t>(n));
                CHECK(respects_g_delta_bound(s));
                CHECK(static_cast<double>(max_realized_rank_error(s)) <= epsilon * static_cast<double>(n) + 1e-9);
            }
        }
    }
}

TEST_CASE("sorted streams keep the bound and stay small") {
    const double epsilon = 0.01;
    const uint64_t n = 20000;
    for (auto strategy : {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED}) {
        for (auto order : {SequentialOrder::ASCENDING, SequentialOrder::DESCENDING}) {
            INFO(to_string(strategy) << (order == SequentialOrder::ASCENDING ? " ascending" : " descending"));
            SequentialGenerator generator(0.5, 10000.0, n, order);
            GKSummary<double> s(epsilon, strategy);
            while (!generator.done()) s.update(generator.next());

            CHECK(respects_g_delta_bound(s));
            CHECK(s.get_num_retained() < n / 10);
            // Values are 1..n, so the value is its own rank
            for (double phi : {0.0, 0.1, 0.25, 0.5, 0.75, 0.9, 1.0}) {
                const double target = static_cast<double>(quantile_to_rank(phi, n));
                CHECK(std::abs(s.get_quantile(phi) - target) <= epsilon * n + 1e-9);
            }
        }
    }
}

TEST_CASE("reported error bounds the realized error") {
    GKSummary<int64_t> s(0.02, CompressionStrategy::MODIFIED);
    auto values = shuffled_range(2000, 99);
    s.update(values.begin(), values.end());

    for (uint64_t target = 1; target <= 2000; target += 37) {
        auto [value, error] = s.get_quantile_with_error(phi_for_rank(target, 2000));
        const double realized = std::abs(static_cast<double>(value) - static_cast<double>(target)) / 2000.0;
        CHECK(realized <= error + 1e-12);
        CHECK(error <= 0.02 + 1e-12);
    }
}

TEST_CASE("compression is idempotent") {
    for (auto strategy : {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED}) {
        INFO(to_string(strategy));
        GKSummary<int64_t> s(0.01, strategy);
        auto values = shuffled_range(5000, 5);
        s.update(values.begin(), values.end());

        s.compress();
        const auto once = s.get_entries();
        s.compress();
        CHECK(s.get_entries() == once);
        CHECK(respects_g_delta_bound(s));
    }
}

TEST_CASE("boundary quantiles are exact") {
    for (auto strategy : {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED}) {
        INFO(to_string(strategy));

        GKSummary<double> single(0.3, strategy);
        single.update(42.5);
        CHECK(single.get_quantile(0.0) == 42.5);
        CHECK(single.get_quantile(0.5) == 42.5);
        CHECK(single.get_quantile(1.0) == 42.5);

        GKSummary<int64_t> coarse(0.2, strategy);
        auto values = shuffled_range(1000, 3);
        coarse.update(values.begin(), values.end());
        CHECK(coarse.get_quantile(0.0) == 1);
        CHECK(coarse.get_quantile(1.0) == 1000);
    }
}

TEST_CASE("median of 1..1000 with epsilon 0.01") {
    for (auto strategy : {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED}) {
        INFO(to_string(strategy));
        GKSummary<int> s(0.01, strategy);
        for (int i = 1; i <= 1000; ++i) s.update(i);

        const int median = s.get_quantile(0.5);
        CHECK(median >= 490);
        CHECK(median <= 510);
    }
}

TEST_CASE("duplicates stay separate entries until compression") {
    GKSummary<int> s(0.001, CompressionStrategy::MODIFIED);
    for (int i = 0; i < 5; ++i) s.update(7);

    CHECK(s.get_num_retained() == 5);
    CHECK(s.get_quantile(0.0) == 7);
    CHECK(s.get_quantile(1.0) == 7);
}

TEST_CASE("get_rank estimates the normalized rank") {
    GKSummary<int> s(0.01, CompressionStrategy::MODIFIED);
    CHECK(s.get_rank(3) == 0.0);
    for (int i = 1; i <= 1000; ++i) s.update(i);

    CHECK(s.get_rank(0) == 0.0);
    CHECK(s.get_rank(1000) == doctest::Approx(1.0));
    CHECK(std::abs(s.get_rank(500) - 0.5) <= 0.02);
}

TEST_CASE("errors are reported to the caller") {
    SUBCASE("epsilon out of range") {
        CHECK_THROWS_AS(GKSummary<int>(0.0), ConfigurationError);
        CHECK_THROWS_AS(GKSummary<int>(1.0), ConfigurationError);
        CHECK_THROWS_AS(GKSummary<int>(-0.5), ConfigurationError);
        CHECK_THROWS_AS(GKSummary<int>(std::numeric_limits<double>::quiet_NaN()), ConfigurationError);
    }

    SUBCASE("phi out of range") {
        GKSummary<int> s(0.1);
        s.update(1);
        CHECK_THROWS_AS(s.get_quantile(-0.1), ConfigurationError);
        CHECK_THROWS_AS(s.get_quantile(1.1), ConfigurationError);
    }

    SUBCASE("empty summary") {
        GKSummary<int> s(0.1);
        CHECK_THROWS_AS(s.get_quantile(0.5), EmptyQueryError);
        CHECK_THROWS_AS(s.get_quantile_with_error(0.0), EmptyQueryError);
    }

    SUBCASE("NaN leaves the summary untouched") {
        for (auto strategy : {CompressionStrategy::CLASSICAL, CompressionStrategy::MODIFIED}) {
            GKSummary<double> s(0.1, strategy);
            s.update(1.0);
            CHECK_THROWS_AS(s.update(std::nan("")), InvalidValueError);
            CHECK(s.get_n() == 1);
            CHECK(s.get_num_retained() == 1);
        }
    }
}

TEST_CASE("GKConfig builds a summary") {
    GKConfig config{0.05, "CLASSICAL"};
    GKSummary<double> s(config);
    CHECK(s.get_epsilon() == 0.05);
    CHECK(s.get_strategy() == CompressionStrategy::CLASSICAL);

    config.strategy = "FAST";
    CHECK_THROWS_AS(GKSummary<double>{config}, ConfigurationError);
}
