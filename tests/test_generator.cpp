#include <doctest/doctest.h>

#include "generator/quantile_generator.hpp"

#include <algorithm>
#include <vector>

namespace {

void check_quantile(QuantileGenerator &generator, double quantile, double value, uint64_t num) {
    REQUIRE(generator.remaining() == num);
    auto values = generator.generate_all();
    REQUIRE(values.size() == num);
    CHECK(generator.done());

    std::sort(values.begin(), values.end());
    CHECK(values[quantile_to_rank(quantile, num) - 1] == value);
}

} // namespace

TEST_CASE("generators place the value at the requested quantile") {
    for (double quantile : {0.0, 0.1, 0.2, 0.5, 0.75, 0.99, 1.0}) {
        for (uint64_t num : {1, 2, 3, 5, 10, 100, 1000, 1001}) {
            INFO("quantile = " << quantile << " num = " << num);

            RandomGenerator random(quantile, 17.0, num, 17);
            check_quantile(random, quantile, 17.0, num);

            SequentialGenerator ascending(quantile, 17.0, num, SequentialOrder::ASCENDING);
            check_quantile(ascending, quantile, 17.0, num);

            SequentialGenerator descending(quantile, 17.0, num, SequentialOrder::DESCENDING);
            check_quantile(descending, quantile, 17.0, num);

            ShuffledGenerator shuffled(quantile, 17.0, num, 3);
            check_quantile(shuffled, quantile, 17.0, num);
        }
    }
}

TEST_CASE("random generator emits the target value exactly once") {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        for (double quantile : {0.0, 0.3, 1.0}) {
            INFO("seed = " << seed << " quantile = " << quantile);
            const auto values = RandomGenerator(quantile, 17.0, 200, seed).generate_all();
            REQUIRE(values.size() == 200);

            CHECK(std::count(values.begin(), values.end(), 17.0) == 1);
            const auto lesser = std::count_if(values.begin(), values.end(), [](double v) { return v < 17.0; });
            CHECK(static_cast<uint64_t>(lesser) == quantile_to_rank(quantile, 200) - 1);
            for (double v : values) {
                CHECK(v > 16.0);
                CHECK(v < 18.0);
            }
        }
    }
}

TEST_CASE("sequential generator steps by one") {
    SequentialGenerator ascending(0.5, 17.0, 3, SequentialOrder::ASCENDING);
    CHECK(ascending.generate_all() == std::vector<double>{16.0, 17.0, 18.0});

    SequentialGenerator descending(0.5, 17.0, 3, SequentialOrder::DESCENDING);
    CHECK(descending.generate_all() == std::vector<double>{18.0, 17.0, 16.0});
}

TEST_CASE("random generator is deterministic for a seed and stays in range") {
    auto first = RandomGenerator(0.5, 17.0, 500, 1).generate_all();
    auto again = RandomGenerator(0.5, 17.0, 500, 1).generate_all();
    auto other = RandomGenerator(0.5, 17.0, 500, 2).generate_all();

    CHECK(first == again);
    CHECK(first != other);
    for (double v : first) {
        CHECK(v > 16.0);
        CHECK(v < 18.0);
    }
}

TEST_CASE("shuffled generator permutes the ascending sequence") {
    auto ascending = SequentialGenerator(0.5, 17.0, 200, SequentialOrder::ASCENDING).generate_all();
    auto shuffled = ShuffledGenerator(0.5, 17.0, 200, 9).generate_all();

    CHECK(shuffled != ascending);
    CHECK(shuffled == ShuffledGenerator(0.5, 17.0, 200, 9).generate_all());
    std::sort(shuffled.begin(), shuffled.end());
    CHECK(shuffled == ascending);
}

TEST_CASE("generators reject misuse") {
    CHECK_THROWS_AS(ShuffledGenerator(0.5, 1.0, 0, 1), ConfigurationError);
    CHECK_THROWS_AS(RandomGenerator(0.5, 1.0, 0, 1), ConfigurationError);
    CHECK_THROWS_AS(SequentialGenerator(1.5, 1.0, 10, SequentialOrder::ASCENDING), ConfigurationError);

    SequentialGenerator single(0.5, 3.0, 1, SequentialOrder::ASCENDING);
    CHECK(single.next() == 3.0);
    CHECK_THROWS_AS(single.next(), std::out_of_range);
}
