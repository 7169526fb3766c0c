#pragma once
// Index-free label filtering
//
// Narrows an already materialised ResourceMap (a previous query result, a
// listing from the durable store) by one more label query. Matching follows
// LabelStore::query exactly, including "a resource without the key never
// matches". Output is keyed by resource type.

#include "query.hpp"
#include "resource_map.hpp"
#include <optional>
#include <unordered_set>

namespace zebra {

inline bool matches(const Query& q, const Resource& res) {
    const Labels& labels = res.labels();
    auto it = labels.find(q.key);
    if (it == labels.end()) return false;
    return q.accepts(it->second);
}

inline std::optional<ResourceMap> filter_label(const Query& q, const ResourceMap& resources) {
    if (!q.well_formed()) return std::nullopt;

    ResourceMap out;
    std::unordered_set<std::string> seen;

    resources.for_each([&](const std::string&, const ResourcePtr& res) {
        if (!matches(q, *res)) return;
        // A resource listed under several keys is reported once
        if (seen.insert(res->id()).second) {
            out.add(res, res->type());
        }
    });
    return out;
}

inline std::optional<ResourceMap> filter_labels(const std::vector<Query>& queries, const ResourceMap& resources) {
    std::optional<ResourceMap> current = resources;
    for (const auto& q : queries) {
        current = filter_label(q, *current);
        if (!current) return std::nullopt;
    }
    return current;
}

} // namespace zebra
