#pragma once
// LabelStore configuration
//
// Plain defaults, optionally overridden from the environment:
//   ZEBRA_VERBOSE               1/true/yes/on enables debug logging
//   ZEBRA_PRUNE_EMPTY_BUCKETS   1/true/yes/on drops buckets that become empty
//   ZEBRA_EXPECTED_RESOURCES    reserve hint for the identity index

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace zebra {

inline bool env_flag(const char* name, bool fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;

    std::string value(raw);
    for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return fallback;
}

struct LabelStoreConfig {
    // Slots are 32-bit, so no store ever holds more resources than this
    static constexpr size_t MAX_EXPECTED_RESOURCES = 0xffffffffu;

    std::string name = "labelstore";     // Log component
    size_t expected_resources = 0;       // Reserve hint for the identity index
    bool prune_empty_buckets = false;    // Drop value buckets left empty by delete/update
    bool verbose = false;                // Debug logging

    static LabelStoreConfig from_env() { return from_env(LabelStoreConfig()); }

    static LabelStoreConfig from_env(LabelStoreConfig base) {
        base.verbose = env_flag("ZEBRA_VERBOSE", base.verbose);
        base.prune_empty_buckets = env_flag("ZEBRA_PRUNE_EMPTY_BUCKETS", base.prune_empty_buckets);

        // Digits only; strtoull would otherwise wrap a leading '-'
        const char* hint = std::getenv("ZEBRA_EXPECTED_RESOURCES");
        if (hint && std::isdigit(static_cast<unsigned char>(hint[0]))) {
            char* end = nullptr;
            errno = 0;
            unsigned long long n = std::strtoull(hint, &end, 10);
            if (*end == '\0' && errno != ERANGE) {
                base.expected_resources = static_cast<size_t>(std::min<unsigned long long>(n, MAX_EXPECTED_RESOURCES));
            }
        }
        return base;
    }
};

} // namespace zebra
