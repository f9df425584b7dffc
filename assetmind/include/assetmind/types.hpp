#pragma once
// Core types: the vocabulary shared by every partition
//
// Time is unix millis. Ids are 128-bit. Confidence is a score in [0,1]
// and, for stored facts, a discrete tier that drives conflict resolution.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

namespace assetmind {

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr int64_t MS_PER_DAY = 86400000;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// 128-bit identifier for stored facts, conflicts and review items
struct FactId {
    uint64_t high = 0;
    uint64_t low = 0;

    static FactId generate() {
        static thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dis;
        return {dis(gen), dis(gen)};
    }

    bool operator==(const FactId& other) const {
        return high == other.high && low == other.low;
    }

    bool operator!=(const FactId& other) const {
        return !(*this == other);
    }

    bool operator<(const FactId& other) const {
        return high < other.high || (high == other.high && low < other.low);
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    static FactId from_string(const std::string& s) {
        FactId id;
        if (s.length() < 36) return id;

        uint32_t a;
        uint16_t b, c, d;
        unsigned long long e;
        if (sscanf(s.c_str(), "%8x-%4hx-%4hx-%4hx-%12llx", &a, &b, &c, &d, &e) == 5) {
            id.high = ((uint64_t)a << 32) | ((uint64_t)b << 16) | c;
            id.low = ((uint64_t)d << 48) | (uint64_t)e;
        }
        return id;
    }

    bool valid() const { return high != 0 || low != 0; }
};

struct FactIdHash {
    size_t operator()(const FactId& id) const {
        return std::hash<uint64_t>{}(id.high) ^ (std::hash<uint64_t>{}(id.low) << 1);
    }
};

// Discrete confidence carried by every stored fact.
// Resolution compares tiers, never raw scores.
enum class ConfidenceTier : uint8_t {
    Experimental = 1,
    Low = 2,
    Medium = 3,
    High = 4,
};

inline int tier_rank(ConfidenceTier t) { return static_cast<int>(t); }

inline const char* tier_name(ConfidenceTier t) {
    switch (t) {
        case ConfidenceTier::Experimental: return "experimental";
        case ConfidenceTier::Low:          return "low";
        case ConfidenceTier::Medium:       return "medium";
        case ConfidenceTier::High:         return "high";
    }
    return "experimental";
}

inline bool parse_tier(const std::string& s, ConfidenceTier& out) {
    if (s == "experimental") { out = ConfidenceTier::Experimental; return true; }
    if (s == "low")          { out = ConfidenceTier::Low; return true; }
    if (s == "medium")       { out = ConfidenceTier::Medium; return true; }
    if (s == "high")         { out = ConfidenceTier::High; return true; }
    return false;
}

// Map a [0,1] score onto the tier scale
inline ConfidenceTier tier_from_score(float score) {
    if (score >= 0.85f) return ConfidenceTier::High;
    if (score >= 0.65f) return ConfidenceTier::Medium;
    if (score >= 0.40f) return ConfidenceTier::Low;
    return ConfidenceTier::Experimental;
}

enum class AssetType : uint8_t {
    CommercialRealEstate = 0,
    PrivateCredit = 1,
    PrivateEquity = 2,
    Infrastructure = 3,
    Unknown = 255,
};

inline const char* asset_type_name(AssetType t) {
    switch (t) {
        case AssetType::CommercialRealEstate: return "commercial_real_estate";
        case AssetType::PrivateCredit:        return "private_credit";
        case AssetType::PrivateEquity:        return "private_equity";
        case AssetType::Infrastructure:       return "infrastructure";
        case AssetType::Unknown:              return "unknown";
    }
    return "unknown";
}

inline AssetType parse_asset_type(const std::string& s) {
    if (s == "commercial_real_estate") return AssetType::CommercialRealEstate;
    if (s == "private_credit")         return AssetType::PrivateCredit;
    if (s == "private_equity")         return AssetType::PrivateEquity;
    if (s == "infrastructure")         return AssetType::Infrastructure;
    return AssetType::Unknown;
}

enum class SecurityLevel : uint8_t {
    Safe = 1,
    Restricted = 2,
    Dangerous = 3,
};

inline const char* security_level_name(SecurityLevel l) {
    switch (l) {
        case SecurityLevel::Safe:       return "safe";
        case SecurityLevel::Restricted: return "restricted";
        case SecurityLevel::Dangerous:  return "dangerous";
    }
    return "restricted";
}

inline bool parse_security_level(const std::string& s, SecurityLevel& out) {
    if (s == "safe")       { out = SecurityLevel::Safe; return true; }
    if (s == "restricted") { out = SecurityLevel::Restricted; return true; }
    if (s == "dangerous")  { out = SecurityLevel::Dangerous; return true; }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text normalization
// ═══════════════════════════════════════════════════════════════════════════

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string normalize(const std::string& s) {
    return to_lower(trim(s));
}

// Sender addresses compare case-insensitively
inline std::string normalize_email(const std::string& s) {
    return normalize(s);
}

// ".PDF", "pdf" and " .pdf " all become ".pdf"
inline std::string normalize_extension(const std::string& ext) {
    std::string e = normalize(ext);
    if (!e.empty() && e[0] != '.') e = "." + e;
    return e;
}

inline std::string extension_of(const std::string& filename) {
    auto pos = filename.find_last_of('.');
    if (pos == std::string::npos || pos + 1 >= filename.size()) return "";
    return normalize_extension(filename.substr(pos));
}

// FNV-1a over the canonical serialization of a fact
inline std::string fingerprint(const std::string& canonical) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : canonical) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)hash);
    return buf;
}

inline float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

} // namespace assetmind
