/**
 * @file bench.cpp
 * @brief Performance benchmarks for status list building and decoding.
 *
 * Measures build (pack + compress), JSON round trip and random-access
 * lookup throughput for each bit width, for regression testing during
 * development.
 *
 * Usage:
 *   ./build/statuslist-bench              # 100 iterations, 100000 statuses
 *   ./build/statuslist-bench 1000 1000000 # custom iterations and list size
 */

#include <statuslist/statuslist.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <vector>

using namespace statuslist;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t DEFAULT_STATUSES = 100000;

// Mostly valid, with a sprinkling of other statuses
static std::vector<StatusCode> make_statuses(std::size_t count, BitWidth width) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<unsigned> pick(0, 99);
    std::uniform_int_distribution<unsigned> value(1, max_status_value(width));

    std::vector<StatusCode> codes(count, 0);
    for (auto& code : codes) {
        if (pick(rng) < 5) {
            code = static_cast<StatusCode>(value(rng));
        }
    }
    return codes;
}

static void bench_build(int bits, std::size_t count, int iterations) {
    auto codes = make_statuses(count, parse_bit_width(bits));

    std::size_t compressed_size = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        auto list = StatusListBuilder::from_statuses(codes, bits).build();
        compressed_size = list.lst().size();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_status_ns = per_iter_us * 1000.0 / static_cast<double>(count);

    std::printf("build  %d-bit   %10.2f µs/iter  %8.3f ns/status  (%zu bytes)\n",
                bits, per_iter_us, per_status_ns, compressed_size);
}

static void bench_roundtrip(int bits, std::size_t count, int iterations) {
    auto codes = make_statuses(count, parse_bit_width(bits));
    std::string json = to_json(StatusListBuilder::from_statuses(codes, bits).build());

    std::size_t decoded = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        StatusListDecoder decoder(from_json(json));
        decoded = decoder.size();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);

    std::printf("decode %d-bit   %10.2f µs/iter  %8zu statuses\n", bits, per_iter_us, decoded);
}

static void bench_lookup(int bits, std::size_t count, int iterations) {
    auto codes = make_statuses(count, parse_bit_width(bits));
    StatusListDecoder decoder(StatusListBuilder::from_statuses(codes, bits).build());

    unsigned checksum = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        for (std::size_t j = 0; j < count; ++j) {
            checksum += decoder.get_status(j);
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    double per_lookup_ns = total_ns / (static_cast<double>(iterations) * static_cast<double>(count));

    std::printf("lookup %d-bit   %10.3f ns/lookup  (checksum %u)\n", bits, per_lookup_ns, checksum);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;
    std::size_t count = DEFAULT_STATUSES;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }
    if (argc >= 3) {
        long requested = std::atol(argv[2]);
        if (requested > 0) {
            count = static_cast<std::size_t>(requested);
        }
    }

    std::printf("Status List Benchmarks (C++ Implementation)\n");
    std::printf("===========================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Statuses:   %zu\n", count);

    const int widths[] = {1, 2, 4, 8};

    std::printf("\nBuild (pack + compress):\n");
    for (int bits : widths) {
        bench_build(bits, count, iterations);
    }

    std::printf("\nDecode (JSON parse + inflate):\n");
    for (int bits : widths) {
        bench_roundtrip(bits, count, iterations);
    }

    std::printf("\nLookup:\n");
    for (int bits : widths) {
        bench_lookup(bits, count, iterations);
    }

    return 0;
}
