/**
 * @file geohash_cache.hpp
 * @brief Bounded LRU cache of neighbor sets.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace geohash {

/**
 * @brief Least-recently-used cache for neighbors(geohash, order).
 *
 * Owned by its caller and not synchronized. A capacity of 0 disables
 * caching.
 */
class NeighborCache {
public:
    static constexpr size_t kDefaultCapacity = 1024;

    explicit NeighborCache(size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    /**
     * @brief Cached neighbors(geohash, order), computing on a miss.
     * @throws GeohashError for invalid arguments; nothing is cached then
     */
    std::vector<std::string> get(const std::string& geohash, int order = 1);

    /**
     * @brief True if (geohash, order) is cached. Does not touch recency.
     */
    bool contains(const std::string& geohash, int order) const;

    void clear();

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }

private:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    static std::string make_key(const std::string& geohash, int order);

    size_t capacity_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;

    // Front = most recently used
    std::list<Entry> entries_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

}  // namespace geohash
