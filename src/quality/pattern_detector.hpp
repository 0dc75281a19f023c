#pragma once
#include <algorithm>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../core/profile.hpp"

namespace dsprof {

struct sample_hash {
    std::size_t operator()(const std::vector<std::string>& v) const {
        std::size_t h = v.size();
        for (const auto& s : v) h ^= std::hash<std::string>{}(s) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};

// Bounded LRU memo of sample -> detected pattern. Safe to share between worker threads.
class PatternCache {
public:
    using result_type = std::optional<special_pattern>;

    explicit PatternCache(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Outer nullopt = miss.
    std::optional<result_type> find(const std::vector<std::string>& sample) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = index_.find(sample);
        if (it == index_.end()) { ++misses_; return std::nullopt; }
        lru_.splice(lru_.begin(), lru_, it->second);
        ++hits_;
        return it->second->second;
    }

    void insert(const std::vector<std::string>& sample, result_type result) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = index_.find(sample);
        if (it != index_.end()) {
            it->second->second = result;
            lru_.splice(lru_.begin(), lru_, it->second);
            return;
        }
        lru_.emplace_front(sample, result);
        index_.emplace(lru_.front().first, lru_.begin());
        if (lru_.size() > capacity_) {
            index_.erase(lru_.back().first);
            lru_.pop_back();
        }
    }

    std::size_t size() const { std::lock_guard<std::mutex> lock(mu_); return lru_.size(); }
    std::size_t capacity() const { return capacity_; }
    std::size_t hits() const { std::lock_guard<std::mutex> lock(mu_); return hits_; }
    std::size_t misses() const { std::lock_guard<std::mutex> lock(mu_); return misses_; }

private:
    using entry = std::pair<std::vector<std::string>, result_type>;

    std::size_t capacity_;
    mutable std::mutex mu_;
    std::list<entry> lru_;
    std::unordered_map<std::vector<std::string>, std::list<entry>::iterator, sample_hash> index_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

// Regex input is bounded: libstdc++ matching recurses per consumed character.
inline constexpr std::size_t kPatternPrefixWindow = 64;
inline constexpr std::size_t kPatternMaxWholeBytes = 1024;

enum class match_scope {
    prefix,    // only the start of the value is significant
    whole,     // anchored at both ends; longer values never match
    enclosed,  // only the first and last byte are significant
};

// Tags free-text samples with the first pattern most of them match.
class PatternDetector {
public:
    PatternDetector(double min_ratio, std::size_t cache_capacity)
        : min_ratio_(min_ratio), cache_(cache_capacity)
    {
        const auto flags = std::regex::ECMAScript | std::regex::optimize;
        rules_ = {
            {special_pattern::email,       std::regex(R"(^[\w.\-]+@[\w.\-]+\.\w+$)", flags), match_scope::whole},
            {special_pattern::phone,       std::regex(R"(^\+?[\d\-()\s]+$)", flags), match_scope::whole},
            {special_pattern::url,         std::regex(R"(^https?://)", flags), match_scope::prefix},
            {special_pattern::json,        std::regex(R"(^[{\[][}\]]$)", flags), match_scope::enclosed},
            {special_pattern::date,        std::regex(R"(^\d{4}-\d{2}-\d{2})", flags), match_scope::prefix},
            {special_pattern::currency,    std::regex("^(\\$|\xC2\xA3|\xE2\x82\xAC|\xC2\xA5)\\d+", flags), match_scope::prefix},
            {special_pattern::geolocation, std::regex(R"(^-?\d+\.\d+,\s*-?\d+\.\d+$)", flags), match_scope::whole},
        };
    }

    std::optional<special_pattern> detect(const std::vector<std::string>& sample) {
        if (sample.empty()) return std::nullopt;
        if (auto cached = cache_.find(sample)) return *cached;
        const auto result = scan(sample);
        cache_.insert(sample, result);
        return result;
    }

    PatternCache& cache() { return cache_; }

private:
    struct rule {
        special_pattern kind;
        std::regex re;
        match_scope scope;
    };

    static bool matches(const rule& r, const std::string& s) {
        switch (r.scope) {
            case match_scope::prefix: {
                const auto end = s.begin() + static_cast<std::ptrdiff_t>(std::min(s.size(), kPatternPrefixWindow));
                return std::regex_search(s.begin(), end, r.re, std::regex_constants::match_continuous);
            }
            case match_scope::whole:
                return s.size() <= kPatternMaxWholeBytes &&
                       std::regex_search(s, r.re, std::regex_constants::match_continuous);
            case match_scope::enclosed:
                return s.size() >= 2 && std::regex_search(std::string{s.front(), s.back()}, r.re);
        }
        return false;
    }

    std::optional<special_pattern> scan(const std::vector<std::string>& sample) const {
        const double needed = min_ratio_ * static_cast<double>(sample.size());
        for (const auto& r : rules_) {
            std::size_t matches_seen = 0;
            for (const auto& s : sample) {
                if (matches(r, s)) ++matches_seen;
            }
            if (static_cast<double>(matches_seen) > needed) return r.kind;
        }
        return std::nullopt;
    }

    double min_ratio_;
    PatternCache cache_;
    std::vector<rule> rules_;
};

}
