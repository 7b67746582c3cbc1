/**
 * @file geohash_cli.cpp
 * @brief Command-line front end for the geohash codec.
 *
 * Prints plain text by default, JSON with --json, GeoJSON for `cell`.
 */

#include "geohash.hpp"
#include "geohash_cache.hpp"
#include "geohash_geometry.hpp"
#include "geohash_parse.hpp"

#include <nlohmann/json.hpp>
#include <bitset>
#include <climits>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// CLI configuration
struct CliConfig {
    int length = geohash::kDefaultLength;
    int order = 1;
    std::string output = "text";
    size_t cache_capacity = geohash::NeighborCache::kDefaultCapacity;
};

CliConfig g_config;

// Integer config field, rejecting floats, strings and booleans
long long config_int(const json& config, const char* key) {
    const json& v = config.at(key);
    if (!v.is_number_integer()) {
        throw std::invalid_argument(std::string("\"") + key + "\" must be an integer, got " + v.dump());
    }
    return v.get<long long>();
}

// Load config from JSON file. g_config is only replaced once every field
// has been checked, so a bad file leaves the defaults untouched.
bool load_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Config file not found: " << config_path << "\n";
        return false;
    }

    try {
        json config = json::parse(file);
        if (!config.is_object()) {
            throw std::invalid_argument("config root must be an object");
        }

        CliConfig loaded = g_config;

        if (config.contains("length")) {
            long long length = config_int(config, "length");
            if (length < 1 || length > INT_MAX) {
                throw geohash::GeohashError(geohash::ErrorCode::InvalidLength,
                                            "\"length\" must be a positive integer, got " +
                                                std::to_string(length));
            }
            loaded.length = static_cast<int>(length);
        }
        if (config.contains("order")) {
            long long order = config_int(config, "order");
            if (order < 1 || order > geohash::kMaxOrder) {
                throw geohash::GeohashError(geohash::ErrorCode::InvalidOrder,
                                            "\"order\" must be in 1.." + std::to_string(geohash::kMaxOrder) +
                                                ", got " + std::to_string(order));
            }
            loaded.order = static_cast<int>(order);
        }
        if (config.contains("output")) {
            loaded.output = config["output"].get<std::string>();
            if (loaded.output != "text" && loaded.output != "json") {
                throw std::invalid_argument("\"output\" must be \"text\" or \"json\", got \"" +
                                            loaded.output + "\"");
            }
        }
        if (config.contains("cache_capacity")) {
            long long capacity = config_int(config, "cache_capacity");
            if (capacity < 0) {
                throw std::invalid_argument("\"cache_capacity\" must not be negative, got " +
                                            std::to_string(capacity));
            }
            loaded.cache_capacity = static_cast<size_t>(capacity);
        }

        g_config = loaded;
        return true;

    } catch (const geohash::GeohashError& e) {
        std::cerr << "Error parsing config (" << geohash::error_code_name(e.code()) << "): " << e.what() << "\n";
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] COMMAND ARGS\n"
              << "Options:\n"
              << "  --config PATH      Config file (default: config/geohash.json)\n"
              << "  --length N         Geohash length for encode (default: 11)\n"
              << "  --order N          Neighbor radius in cells (default: 1)\n"
              << "  --json             JSON output\n"
              << "  --help             Show this help\n"
              << "Commands:\n"
              << "  encode LAT,LNG [LAT,LNG ...]\n"
              << "  decode GEOHASH [GEOHASH ...]\n"
              << "  interval GEOHASH [GEOHASH ...]\n"
              << "  neighbors GEOHASH [GEOHASH ...]\n"
              << "  validate GEOHASH [GEOHASH ...]\n"
              << "  bits GEOHASH [GEOHASH ...]\n"
              << "  cell GEOHASH [GEOHASH ...]\n";
}

// Helper: GeoJSON feature for a cell, coordinates as [lng, lat]
json build_cell_feature(const std::string& hash) {
    json ring = json::array();
    for (const auto& [lat, lng] : geohash::cell_boundary(hash)) {
        ring.push_back({lng, lat});
    }

    return {
        {"type", "Feature"},
        {"geometry", {
            {"type", "Polygon"},
            {"coordinates", json::array({ring})}
        }},
        {"properties", {
            {"geohash", hash},
            {"length", hash.size()}
        }}
    };
}

json run_encode(const std::string& arg, bool as_json) {
    geohash::LatLng input = geohash::parse_lat_lng(arg);
    geohash::LatLng normalized = geohash::normalize(input);
    std::string hash = geohash::encode(input, g_config.length);

    if (!as_json) {
        std::cout << hash << "\n";
        return nullptr;
    }
    return {
        {"input", {input.lat, input.lng}},
        {"normalized", {normalized.lat, normalized.lng}},
        {"length", g_config.length},
        {"geohash", hash}
    };
}

json run_decode(const std::string& hash, bool as_json) {
    geohash::LatLng p = geohash::decode_point(hash);
    if (!as_json) {
        std::cout << p.lat << "," << p.lng << "\n";
        return nullptr;
    }
    return {{"geohash", hash}, {"lat", p.lat}, {"lng", p.lng}};
}

json run_interval(const std::string& hash, bool as_json) {
    geohash::CellInterval cell = geohash::decode_interval(hash);
    if (!as_json) {
        std::cout << std::setprecision(12)
                  << "lat [" << cell.lat.min << ", " << cell.lat.max << "] "
                  << "lng [" << cell.lng.min << ", " << cell.lng.max << "]\n";
        return nullptr;
    }
    return {
        {"geohash", hash},
        {"lat", {cell.lat.min, cell.lat.max}},
        {"lng", {cell.lng.min, cell.lng.max}}
    };
}

json run_neighbors(const std::string& hash, geohash::NeighborCache& cache, bool as_json) {
    std::vector<std::string> result = cache.get(hash, g_config.order);
    if (!as_json) {
        for (const auto& n : result) std::cout << n << "\n";
        return nullptr;
    }
    return {{"geohash", hash}, {"order", g_config.order}, {"neighbors", result}};
}

json run_bits(const std::string& hash, bool as_json) {
    uint64_t bits = geohash::to_bits(hash);
    std::string text = std::bitset<64>(bits).to_string().substr(64 - 5 * hash.size());
    if (!as_json) {
        std::cout << text << "\n";
        return nullptr;
    }
    return {{"geohash", hash}, {"bits", text}, {"value", bits}};
}

json run_cell(const std::string& hash) {
    return build_cell_feature(hash);
}

int main(int argc, char* argv[]) {
    std::string config_path = "config/geohash.json";
    bool use_config = false;
    int cli_length = -1;
    int cli_order = -1;
    bool cli_json = false;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
                use_config = true;
            } else if (arg == "--length" && i + 1 < argc) {
                cli_length = geohash::parse_length(argv[++i]);
            } else if (arg == "--order" && i + 1 < argc) {
                cli_order = geohash::parse_order(argv[++i]);
            } else if (arg == "--json") {
                cli_json = true;
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // Only load config if explicitly specified with --config
    if (use_config && !load_config(config_path)) {
        return 1;
    }

    // Command line overrides config
    if (cli_length > 0) g_config.length = cli_length;
    if (cli_order > 0) g_config.order = cli_order;
    if (cli_json) g_config.output = "json";

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = positional[0];
    const bool as_json = (g_config.output == "json");
    geohash::NeighborCache cache(g_config.cache_capacity);

    json results = json::array();
    bool all_valid = true;

    try {
        for (size_t i = 1; i < positional.size(); ++i) {
            const std::string& arg = positional[i];
            json r;

            if (command == "encode") {
                r = run_encode(arg, as_json);
            } else if (command == "decode") {
                r = run_decode(arg, as_json);
            } else if (command == "interval") {
                r = run_interval(arg, as_json);
            } else if (command == "neighbors") {
                r = run_neighbors(arg, cache, as_json);
            } else if (command == "bits") {
                r = run_bits(arg, as_json);
            } else if (command == "cell") {
                r = run_cell(arg);
            } else if (command == "validate") {
                geohash::ValidationResult v = geohash::validate(arg);
                all_valid = all_valid && v.ok;
                if (as_json) {
                    r = {{"geohash", arg}, {"valid", v.ok}};
                    if (!v.ok) {
                        r["code"] = geohash::error_code_name(v.code);
                        r["error"] = v.error;
                    }
                } else {
                    std::cout << arg << ": " << (v.ok ? "ok" : v.error) << "\n";
                }
            } else {
                std::cerr << "Unknown command: " << command << "\n";
                print_usage(argv[0]);
                return 1;
            }

            if (!r.is_null()) results.push_back(r);
        }
    } catch (const geohash::GeohashError& e) {
        std::cerr << "Error (" << geohash::error_code_name(e.code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (command == "cell") {
        json collection = {{"type", "FeatureCollection"}, {"features", results}};
        std::cout << collection.dump(2) << "\n";
    } else if (as_json) {
        std::cout << (results.size() == 1 ? results[0] : results).dump(2) << "\n";
    }

    return all_valid ? 0 : 1;
}
