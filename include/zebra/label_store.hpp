#pragma once
// LabelStore: in-memory label index over shared resources
//
// Architecture:
//   - Slot table: every indexed resource gets a dense 32-bit slot
//   - Identity index: resource id -> slot (source of truth for existence)
//   - Label index: label key -> label value -> Posting (roaring bitmap of slots)
//
// A single reader/writer lock guards both indices jointly. Writers
// (create/update/remove/clear/wipe) are serialized; readers (query/load)
// run concurrently and always observe a state some serialization of the
// writes produced.
//
// States: Uninitialized (default constructed) and Wiped have no indices;
// initialize()/clear() make the store Ready. Every other entry point
// re-checks readiness and fails with Errc::Uninitialized instead of
// touching absent indices.

#include "config.hpp"
#include "log.hpp"
#include "posting.hpp"
#include "query.hpp"
#include "resource.hpp"
#include "resource_map.hpp"
#include "status.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace zebra {

struct LabelStoreStats {
    size_t resources = 0;       // Entries in the identity index
    size_t label_keys = 0;      // Distinct label keys
    size_t buckets = 0;         // Distinct (key, value) pairs, empty ones included
    size_t empty_buckets = 0;   // Buckets left empty by delete/update
    uint64_t postings = 0;      // Total (resource, label) memberships
    size_t memory_bytes = 0;    // Approximate index footprint

    json to_json() const {
        return {
            {"resources", resources},
            {"label_keys", label_keys},
            {"buckets", buckets},
            {"empty_buckets", empty_buckets},
            {"postings", postings},
            {"memory_bytes", memory_bytes}
        };
    }
};

class LabelStore {
public:
    // Uninitialized until initialize() or clear()
    LabelStore() = default;

    explicit LabelStore(LabelStoreConfig config) : config_(std::move(config)) {
        if (config_.verbose) log::set_verbose(true);
    }

    // Ready, seeded from a snapshot. Invalid resources and repeated
    // identifiers are skipped with a warning; the first occurrence wins.
    explicit LabelStore(const ResourceMap& snapshot, LabelStoreConfig config = {})
        : config_(std::move(config)) {
        if (config_.verbose) log::set_verbose(true);

        index_ = make_indices();
        size_t seeded = 0;
        size_t skipped = 0;

        snapshot.for_each([&](const std::string&, const ResourcePtr& res) {
            Status status = res ? res->validate()
                                : Status::fail(Errc::ValidationFailed, "null resource");
            if (status) status = insert_locked(res);

            if (status) {
                ++seeded;
            } else {
                ++skipped;
                log_warn(component(), "snapshot entry skipped: %s", status.describe().c_str());
            }
        });

        log_debug(component(), "seeded %zu resources from snapshot (%zu skipped)", seeded, skipped);
    }

    LabelStore(const LabelStore&) = delete;
    LabelStore& operator=(const LabelStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Idempotent: keeps existing indices (e.g. seeded from a snapshot)
    Status initialize() {
        std::unique_lock lock(mutex_);
        if (!index_) {
            index_ = make_indices();
            log_debug(component(), "initialized");
        }
        return Status::ok();
    }

    // Fresh, empty, operable indices
    Status clear() {
        std::unique_lock lock(mutex_);
        index_ = make_indices();
        log_debug(component(), "cleared");
        return Status::ok();
    }

    // Drop the indices entirely; the store is unusable until initialize()/clear()
    Status wipe() {
        std::unique_lock lock(mutex_);
        index_.reset();
        log_debug(component(), "wiped");
        return Status::ok();
    }

    bool ready() const {
        std::shared_lock lock(mutex_);
        return index_ != nullptr;
    }

    const LabelStoreConfig& config() const { return config_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Mutation
    // ═══════════════════════════════════════════════════════════════════════

    // Index a resource under its identifier and every label it carries
    Status create(const ResourcePtr& res) {
        if (!res) return Status::fail(Errc::ValidationFailed, "null resource");
        if (Status status = res->validate(); !status) return status;

        std::unique_lock lock(mutex_);
        if (!index_) return not_ready("create");

        return insert_locked(res);
    }

    // Replace the resource stored under res->id() with res, in one step.
    // Buckets for the new labels are allocated before anything is unlinked,
    // so a staging failure (Errc::Internal) leaves the previous state intact.
    Status update(const ResourcePtr& res) {
        if (!res) return Status::fail(Errc::ValidationFailed, "null resource");
        if (Status status = res->validate(); !status) return status;

        std::unique_lock lock(mutex_);
        if (!index_) return not_ready("update");

        auto it = index_->ids.find(res->id());
        if (it == index_->ids.end()) {
            return Status::fail(Errc::NotFound, "resource " + res->id() + " does not exist");
        }

        uint32_t slot = it->second;
        Entry& entry = index_->slots[slot];

        Labels next;
        Labels dropped;
        std::vector<Posting*> targets;
        try {
            next = res->labels();
            targets = stage_locked(next);
            for (const auto& [key, value] : entry.labels) {
                auto kept = next.find(key);
                if (kept == next.end() || kept->second != value) dropped.emplace(key, value);
            }
        } catch (const std::bad_alloc&) {
            log_error(component(), "update of %s could not be staged", res->id().c_str());
            return Status::fail(Errc::Internal, "could not stage update of " + res->id());
        }

        // Link before unlinking: adding to a fresh bucket may allocate a
        // roaring container, removing never does. Pairs carried over
        // unchanged stay linked.
        for (Posting* posting : targets) posting->add(slot);
        unlink_locked(slot, dropped);

        entry.res = res;
        entry.labels.swap(next);

        if (config_.prune_empty_buckets) prune_locked(dropped);
        return Status::ok();
    }

    // Drop a resource from both indices. Removing an identifier that is
    // not indexed succeeds and changes nothing.
    Status remove(const ResourcePtr& res) {
        if (!res) return Status::fail(Errc::ValidationFailed, "null resource");
        if (Status status = res->validate(); !status) return status;

        std::unique_lock lock(mutex_);
        if (!index_) return not_ready("remove");

        auto it = index_->ids.find(res->id());
        if (it == index_->ids.end()) return Status::ok();

        uint32_t slot = it->second;
        Entry& entry = index_->slots[slot];

        // The labels recorded at index time decide which buckets hold the slot
        unlink_locked(slot, entry.labels);
        if (config_.prune_empty_buckets) prune_locked(entry.labels);

        entry.res.reset();
        entry.labels.clear();
        index_->ids.erase(it);
        index_->free.add(slot);
        return Status::ok();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════

    // Resources matching one label query, keyed by resource type.
    // std::nullopt when the query is malformed or the store is not ready;
    // an empty map is a valid query with no matches.
    std::optional<ResourceMap> query(const Query& q) const {
        if (!q.well_formed()) {
            log_debug(component(), "rejected query: %s", q.to_string().c_str());
            return std::nullopt;
        }

        std::shared_lock lock(mutex_);
        if (!index_) return std::nullopt;

        return materialize_locked(match_locked(q));
    }

    // Conjunction of label queries, evaluated under one read lock
    std::optional<ResourceMap> query_all(const std::vector<Query>& queries) const {
        if (queries.empty()) return std::nullopt;
        for (const auto& q : queries) {
            if (!q.well_formed()) {
                log_debug(component(), "rejected query: %s", q.to_string().c_str());
                return std::nullopt;
            }
        }

        std::shared_lock lock(mutex_);
        if (!index_) return std::nullopt;

        Posting matched = match_locked(queries.front());
        for (size_t i = 1; i < queries.size() && !matched.empty(); ++i) {
            matched.intersect(match_locked(queries[i]));
        }
        return materialize_locked(matched);
    }

    // Full export: one entry per non-empty bucket, keyed "key = value".
    // Lists are fresh copies; editing them never touches the index.
    // Keys or values containing " = " can render the same export key
    // ("a = b"/"c" and "a"/"b = c"); the later bucket then replaces the earlier.
    Status load(ResourceMap& out) const {
        std::shared_lock lock(mutex_);
        if (!index_) return not_ready("load");

        out.clear();
        for (const auto& [key, values] : index_->labels) {
            for (const auto& [value, posting] : values) {
                if (posting.empty()) continue;

                ResourceList list;
                list.reserve(posting.cardinality());
                for (uint32_t slot : posting.slots()) {
                    list.push_back(index_->slots[slot].res);
                }
                out.put(key + " = " + value, std::move(list));
            }
        }
        return Status::ok();
    }

    ResourcePtr find(const std::string& id) const {
        std::shared_lock lock(mutex_);
        if (!index_) return nullptr;

        auto it = index_->ids.find(id);
        if (it == index_->ids.end()) return nullptr;
        return index_->slots[it->second].res;
    }

    bool contains(const std::string& id) const {
        std::shared_lock lock(mutex_);
        return index_ && index_->ids.find(id) != index_->ids.end();
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return index_ ? index_->ids.size() : 0;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Statistics
    // ═══════════════════════════════════════════════════════════════════════

    LabelStoreStats stats() const {
        std::shared_lock lock(mutex_);
        LabelStoreStats s;
        if (!index_) return s;

        s.resources = index_->ids.size();
        s.label_keys = index_->labels.size();

        size_t bytes = index_->slots.capacity() * sizeof(Entry);
        bytes += index_->ids.size() * (sizeof(std::string) + sizeof(uint32_t) + 32);
        bytes += index_->free.size_in_bytes();

        for (const auto& [key, values] : index_->labels) {
            bytes += key.size() + sizeof(std::string);
            for (const auto& [value, posting] : values) {
                ++s.buckets;
                if (posting.empty()) ++s.empty_buckets;
                s.postings += posting.cardinality();
                bytes += value.size() + sizeof(std::string) + posting.size_in_bytes();
            }
        }
        s.memory_bytes = bytes;
        return s;
    }

private:
    using ValueIndex = std::map<std::string, Posting>;

    // Forward record: the resource and the labels it was indexed under
    struct Entry {
        ResourcePtr res;
        Labels labels;
    };

    struct Indices {
        std::unordered_map<std::string, uint32_t> ids;           // id -> slot
        std::vector<Entry> slots;                                 // slot -> entry
        Posting free;                                             // recycled slots
        std::unordered_map<std::string, ValueIndex> labels;       // key -> value -> slots
    };

    std::unique_ptr<Indices> make_indices() const {
        auto indices = std::make_unique<Indices>();
        if (config_.expected_resources > 0) {
            try {
                indices->slots.reserve(config_.expected_resources);
                indices->ids.reserve(config_.expected_resources);
            } catch (const std::length_error&) {
                log_warn(component(), "reserve hint %zu too large, ignored", config_.expected_resources);
            } catch (const std::bad_alloc&) {
                log_warn(component(), "reserve hint %zu could not be allocated, ignored", config_.expected_resources);
            }
        }
        return indices;
    }

    const char* component() const { return config_.name.c_str(); }

    Status not_ready(const char* op) const {
        return Status::fail(Errc::Uninitialized, std::string(op) + " on a store that is not initialized");
    }

    // Everything below expects the write lock (or, for the const helpers,
    // at least the read lock) to be held by the caller.

    // Ensure a bucket exists for every label; returns the postings to fill.
    // May throw std::bad_alloc, in which case only empty buckets were added.
    std::vector<Posting*> stage_locked(const Labels& labels) {
        std::vector<Posting*> targets;
        targets.reserve(labels.size());
        for (const auto& [key, value] : labels) {
            targets.push_back(&index_->labels[key][value]);
        }
        return targets;
    }

    Status insert_locked(const ResourcePtr& res) {
        const std::string& id = res->id();
        if (index_->ids.find(id) != index_->ids.end()) {
            return Status::fail(Errc::AlreadyExists, "resource " + id + " already exists");
        }

        bool recycled = !index_->free.empty();
        if (!recycled && index_->slots.size() >= std::numeric_limits<uint32_t>::max()) {
            return Status::fail(Errc::Internal, "slot space exhausted");
        }
        uint32_t slot = recycled ? index_->free.minimum()
                                 : static_cast<uint32_t>(index_->slots.size());

        auto& slots = index_->slots;
        Labels labels;
        std::vector<Posting*> targets;
        try {
            labels = res->labels();
            targets = stage_locked(labels);
            if (!recycled && slots.size() == slots.capacity()) {
                slots.reserve(std::max<size_t>(64, slots.capacity() * 2));
            }
            index_->ids.emplace(id, slot);
        } catch (const std::bad_alloc&) {
            log_error(component(), "create of %s could not be staged", id.c_str());
            return Status::fail(Errc::Internal, "could not stage create of " + id);
        }

        if (recycled) {
            index_->free.remove(slot);
        } else {
            slots.emplace_back();
        }
        slots[slot].res = res;
        slots[slot].labels.swap(labels);
        for (Posting* posting : targets) posting->add(slot);
        return Status::ok();
    }

    void unlink_locked(uint32_t slot, const Labels& labels) {
        for (const auto& [key, value] : labels) {
            auto key_it = index_->labels.find(key);
            if (key_it == index_->labels.end()) continue;

            auto value_it = key_it->second.find(value);
            if (value_it == key_it->second.end()) continue;

            value_it->second.remove(slot);
        }
    }

    void prune_locked(const Labels& labels) {
        for (const auto& [key, value] : labels) {
            auto key_it = index_->labels.find(key);
            if (key_it == index_->labels.end()) continue;

            auto value_it = key_it->second.find(value);
            if (value_it != key_it->second.end() && value_it->second.empty()) {
                key_it->second.erase(value_it);
            }
            if (key_it->second.empty()) {
                index_->labels.erase(key_it);
            }
        }
    }

    // Unknown keys and unknown values resolve to an empty posting
    Posting match_locked(const Query& q) const {
        Posting result;

        auto key_it = index_->labels.find(q.key);
        if (key_it == index_->labels.end()) return result;
        const ValueIndex& values = key_it->second;

        switch (q.op) {
            case Operator::MatchEqual:
            case Operator::MatchIn:
                for (const auto& value : q.values) {
                    auto value_it = values.find(value);
                    if (value_it != values.end()) result.merge(value_it->second);
                }
                break;
            case Operator::MatchNotEqual:
            case Operator::MatchNotIn:
                for (const auto& [value, posting] : values) {
                    if (q.accepts(value)) result.merge(posting);
                }
                break;
        }
        return result;
    }

    ResourceMap materialize_locked(const Posting& matched) const {
        ResourceMap out;
        for (uint32_t slot : matched.slots()) {
            const ResourcePtr& res = index_->slots[slot].res;
            if (res) out.add(res, res->type());
        }
        return out;
    }

    LabelStoreConfig config_;
    mutable std::shared_mutex mutex_;
    std::unique_ptr<Indices> index_;
};

} // namespace zebra
