/**
 * @file benchmark_geohash.cpp
 * @brief Benchmark tool timing encode, decode and neighbor generation.
 *
 * Inputs are drawn from [-300, 300] on both axes so that the normalization
 * path is exercised along with the bisection itself.
 */

#include "geohash.hpp"
#include "geohash_cache.hpp"
#include "geohash_parse.hpp"

#include <iostream>
#include <sys/resource.h>
#include <iomanip>
#include <chrono>
#include <random>
#include <string>
#include <vector>

// Helper to get peak RSS memory usage in MB
double get_memory_usage_mb() {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return usage.ru_maxrss / 1024.0; // Linux: ru_maxrss is in KB
    }
    return 0.0;
}

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_timing(const std::string& label, double total_ms, size_t calls) {
    std::cout << std::left << std::setw(22) << label << std::right
              << std::setw(10) << total_ms << " ms"
              << std::setw(10) << (calls ? total_ms * 1000.0 / calls : 0.0) << " us/call\n";
}

template <typename Fn>
double time_ms(Fn&& fn) {
    auto t0 = std::chrono::steady_clock::now();
    fn();
    auto t1 = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(t1 - t0).count();
}

int main(int argc, char* argv[]) {
    size_t data_size = 10000;
    int length = geohash::kDefaultLength;
    int order = 1;
    unsigned int seed = 42;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--data-size" && i + 1 < argc) {
                data_size = std::stoul(argv[++i]);
            } else if (arg == "--length" && i + 1 < argc) {
                length = geohash::parse_length(argv[++i]);
            } else if (arg == "--order" && i + 1 < argc) {
                order = geohash::parse_order(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<unsigned int>(std::stoul(argv[++i]));
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "  --data-size N   Number of random coordinates (default: 10000)\n"
                          << "  --length L      Geohash length (default: 11)\n"
                          << "  --order K       Neighbor order (default: 1)\n"
                          << "  --seed S        Random seed (default: 42)\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Starting Geohash Benchmark\n";
    std::cout << "Data size: " << data_size << ", length: " << length << ", order: " << order << "\n";
    print_separator();

    double baseline_mem = get_memory_usage_mb();
    std::cout << "Baseline Memory: " << std::fixed << std::setprecision(2) << baseline_mem << " MB\n";
    print_separator();

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> dist(-300.0, 300.0);

    std::vector<geohash::LatLng> points;
    points.reserve(data_size);
    for (size_t i = 0; i < data_size; ++i) {
        points.push_back({dist(rng), dist(rng)});
    }

    std::vector<std::string> hashes;
    hashes.reserve(data_size);

    try {
        double encode_ms = time_ms([&]() {
            for (const auto& p : points) hashes.push_back(geohash::encode(p, length));
        });

        double checksum = 0.0;
        double decode_ms = time_ms([&]() {
            for (const auto& h : hashes) {
                geohash::LatLng p = geohash::decode_point(h);
                checksum += p.lat + p.lng;
            }
        });

        double interval_ms = time_ms([&]() {
            for (const auto& h : hashes) {
                geohash::CellInterval c = geohash::decode_interval(h);
                checksum += c.lat.width() + c.lng.width();
            }
        });

        size_t neighbor_count = 0;
        double neighbors_ms = time_ms([&]() {
            for (const auto& h : hashes) neighbor_count += geohash::neighbors(h, order).size();
        });

        std::cout << "[TEST 1] Codec operations\n";
        print_timing("encode", encode_ms, data_size);
        print_timing("decode_point", decode_ms, data_size);
        print_timing("decode_interval", interval_ms, data_size);
        print_timing("neighbors", neighbors_ms, data_size);
        std::cout << "Neighbors generated: " << neighbor_count << "\n";
        std::cout << "Checksum: " << checksum << "\n";
        print_separator();

        // Repeated workload: every geohash asked for twice
        std::cout << "[TEST 2] Neighbor cache (capacity " << data_size << ")\n";
        geohash::NeighborCache cache(data_size);
        double cached_ms = time_ms([&]() {
            for (int pass = 0; pass < 2; ++pass) {
                for (const auto& h : hashes) cache.get(h, order);
            }
        });
        uint64_t lookups = cache.hits() + cache.misses();
        print_timing("neighbors (cached)", cached_ms, static_cast<size_t>(lookups));
        std::cout << "Hits: " << cache.hits() << ", misses: " << cache.misses()
                  << ", hit rate: " << (lookups ? 100.0 * cache.hits() / lookups : 0.0) << "%\n";
        print_separator();

    } catch (const std::exception& e) {
        std::cerr << "Benchmark failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Peak RSS: " << get_memory_usage_mb() << " MB\n";
    return 0;
}
