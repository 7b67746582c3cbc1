/**
 * @file geohash_cache.cpp
 * @brief NeighborCache implementation.
 */

#include "geohash_cache.hpp"
#include "geohash.hpp"

namespace geohash {

std::string NeighborCache::make_key(const std::string& hash, int order) {
    // '/' is outside the alphabet, so keys cannot collide
    return hash + "/" + std::to_string(order);
}

std::vector<std::string> NeighborCache::get(const std::string& hash, int order) {
    if (capacity_ == 0) {
        std::vector<std::string> result = neighbors(hash, order);
        ++misses_;
        return result;
    }

    const std::string key = make_key(hash, order);
    auto it = index_.find(key);
    if (it != index_.end()) {
        ++hits_;
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    std::vector<std::string> result = neighbors(hash, order);
    ++misses_;

    if (entries_.size() >= capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
    entries_.emplace_front(key, result);
    index_[key] = entries_.begin();
    return result;
}

bool NeighborCache::contains(const std::string& hash, int order) const {
    return index_.find(make_key(hash, order)) != index_.end();
}

void NeighborCache::clear() {
    entries_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

}  // namespace geohash
