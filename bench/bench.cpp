/**
 * @file bench.cpp
 * @brief Performance benchmarks for hashprim SHA-256.
 *
 * Measures block compression and whole-message hashing throughput for
 * regression testing during development. Note: Desktop performance differs
 * from embedded targets - use for relative comparisons only.
 *
 * Usage:
 *   ./build/hashprim_bench              # Run with default 100 iterations
 *   ./build/hashprim_bench 1000         # Run with custom iteration count
 */

#include <hashprim/hashprim.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace hashprim;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t BLOCKS_PER_ITER = 1024;

static void fill_pattern(std::vector<std::uint8_t>& data) {
    word_t x = 0x6a09e667U;
    for (auto& byte : data) {
        x = rotr(x, 7) ^ (x + 0x9e3779b9U);
        byte = static_cast<std::uint8_t>(x & 0xFFU);
    }
}

static void print_result(const char* name, double total_us, int iterations,
                         std::size_t bytes_per_iter) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_block_us = per_iter_us / static_cast<double>(bytes_per_iter / BLOCK_BYTES);
    double throughput_mbps = static_cast<double>(bytes_per_iter) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %6.3f µs/blk  %8.1f MB/s  (%zu bytes)\n", name,
                per_iter_us, per_block_us, throughput_mbps, bytes_per_iter);
}

static void bench_compress(int iterations) {
    std::vector<std::uint8_t> input(BLOCKS_PER_ITER * BLOCK_BYTES);
    fill_pattern(input);

    State state = INITIAL_HASH;

    // Warmup run
    for (std::size_t b = 0; b < BLOCKS_PER_ITER; ++b) {
        compress_block(state, &input[b * BLOCK_BYTES]);
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        for (std::size_t b = 0; b < BLOCKS_PER_ITER; ++b) {
            compress_block(state, &input[b * BLOCK_BYTES]);
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    print_result("compress_block", total_us, iterations, input.size());

    // Keep the result observable
    std::printf("%-20s state[0]=%08x\n", "", static_cast<unsigned>(state[0]));
}

static bool bench_sha256(int iterations) {
    std::vector<std::uint8_t> input(BLOCKS_PER_ITER * BLOCK_BYTES);
    fill_pattern(input);

    Digest digest{};

    // Warmup run
    if (sha256(input.data(), input.size(), digest) != Error::Ok) {
        std::fprintf(stderr, "Error: sha256 failed during warmup\n");
        return false;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        auto result = sha256(input.data(), input.size(), digest);
        if (result != Error::Ok) {
            std::fprintf(stderr, "Error: sha256 failed: %s\n", error_string(result));
            return false;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    print_result("sha256", total_us, iterations, input.size());
    std::printf("%-20s %s\n", "", to_hex(digest.data(), digest.size()).c_str());
    return true;
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("hashprim Benchmarks (C++ Implementation)\n");
    std::printf("========================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Message size: %zu blocks (%zu bytes)\n\n", BLOCKS_PER_ITER,
                BLOCKS_PER_ITER * BLOCK_BYTES);

    bench_compress(iterations);
    if (!bench_sha256(iterations)) {
        return 1;
    }

    std::printf("\nNote: Desktop performance differs from embedded targets.\n");
    std::printf("Use these results for relative comparisons only.\n");

    return 0;
}
