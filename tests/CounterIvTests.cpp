#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "TestUtils.hpp"
#include <limits>

using sealstream::CounterIv;

TEST_CASE("Counter is stored big-endian after the nonce", "[iv]") {
    const std::vector<uint8_t> nonce = {1, 2, 3, 4, 5, 6, 7, 8};
    const auto iv = CounterIv::from(nonce, 0x0102030405060708ULL);

    const std::vector<uint8_t> expected = {1, 2, 3, 4, 5, 6, 7, 8, 1, 2, 3, 4, 5, 6, 7, 8};
    REQUIRE(iv.getBytes() == expected);
    REQUIRE(iv.getNonce() == nonce);
    REQUIRE(iv.getCounter() == 0x0102030405060708ULL);
}

TEST_CASE("Counter advances by whole blocks", "[iv]") {
    const auto [length, blocks] = GENERATE(table<size_t, uint64_t>({
        {0, 0},
        {1, 1},
        {15, 1},
        {16, 1},
        {17, 2},
        {4095, 256},
        {4096, 256}
    }));

    const auto iv = CounterIv(sealstream::test::createTestIv(1000));
    const auto next = iv.advanced(length);

    REQUIRE(CounterIv::blocksFor(length) == blocks);
    REQUIRE(next.getCounter() == 1000 + blocks);
    REQUIRE(next.getNonce() == iv.getNonce());
    REQUIRE(iv.getCounter() == 1000);
}

TEST_CASE("Counter that would wrap is rejected", "[iv]") {
    const auto max = std::numeric_limits<uint64_t>::max();
    const auto iv = CounterIv(sealstream::test::createTestIv(max - 2));

    REQUIRE(iv.advanced(32).getCounter() == max);
    REQUIRE_FALSE(iv.advanced(32).isExhausted());
    REQUIRE(iv.fits(48));
    REQUIRE_FALSE(iv.fits(49));
    REQUIRE_THROWS_AS(iv.advanced(49), sealstream::StreamTooLargeException);
}

TEST_CASE("Last counter block is usable once", "[iv]") {
    const auto max = std::numeric_limits<uint64_t>::max();
    const auto iv = CounterIv(sealstream::test::createTestIv(max));

    REQUIRE(iv.fits(16));
    const auto exhausted = iv.advanced(16);
    REQUIRE(exhausted.isExhausted());
    REQUIRE(exhausted.getNonce() == iv.getNonce());

    REQUIRE(exhausted.fits(0));
    REQUIRE(exhausted.advanced(0) == exhausted);
    REQUIRE_FALSE(exhausted.fits(1));
    REQUIRE_THROWS_AS(exhausted.advanced(1), sealstream::StreamTooLargeException);
    REQUIRE_THROWS_AS(iv.advanced(17), sealstream::StreamTooLargeException);
}

TEST_CASE("IV of the wrong length is rejected", "[iv]") {
    REQUIRE_THROWS_AS(CounterIv(std::vector<uint8_t>(15)), sealstream::InvalidParametersException);
    REQUIRE_THROWS_AS(CounterIv(std::vector<uint8_t>(17)), sealstream::InvalidParametersException);
    REQUIRE_THROWS_AS(CounterIv::from(std::vector<uint8_t>(7), 0), sealstream::InvalidParametersException);
}
