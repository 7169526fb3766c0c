#pragma once
// ResourceMap: key -> list of resources sharing that key
//
// Used as the result type of label queries (keyed by resource type) and
// as the flattened export of the label index (keyed by "key = value").
// Lists hold shared references; copying a list never clones resources.

#include "resource.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace zebra {

using ResourceList = std::vector<ResourcePtr>;

// Replace dst with a fresh list referencing the same resources as src
inline void copy_resource_list(ResourceList& dst, const ResourceList& src) {
    dst.clear();
    dst.reserve(src.size());
    dst.insert(dst.end(), src.begin(), src.end());
}

class ResourceFactory;

class ResourceMap {
public:
    ResourceMap() = default;

    void add(const ResourcePtr& res, const std::string& key) {
        if (!res) return;
        resources_[key].push_back(res);
    }

    // Remove the resource with res's identifier from the list under key
    void remove(const ResourcePtr& res, const std::string& key) {
        if (!res) return;
        auto it = resources_.find(key);
        if (it == resources_.end()) return;

        auto& list = it->second;
        const std::string& id = res->id();
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&id](const ResourcePtr& r) { return r->id() == id; }),
                   list.end());
    }

    // Install a list under key, replacing any existing one. Null entries
    // are dropped, as add() does.
    void put(const std::string& key, ResourceList list) {
        list.erase(std::remove(list.begin(), list.end(), nullptr), list.end());
        resources_[key] = std::move(list);
    }

    const ResourceList* find(const std::string& key) const {
        auto it = resources_.find(key);
        return it != resources_.end() ? &it->second : nullptr;
    }

    ResourceList* find(const std::string& key) {
        auto it = resources_.find(key);
        return it != resources_.end() ? &it->second : nullptr;
    }

    bool contains(const std::string& key) const {
        return resources_.find(key) != resources_.end();
    }

    // Number of keys
    size_t size() const { return resources_.size(); }
    bool empty() const { return resources_.empty(); }

    // Number of resource references across all keys
    size_t total() const {
        size_t n = 0;
        for (const auto& [key, list] : resources_) n += list.size();
        return n;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(resources_.size());
        for (const auto& [key, list] : resources_) out.push_back(key);
        return out;
    }

    void for_each(const std::function<void(const std::string&, const ResourcePtr&)>& fn) const {
        for (const auto& [key, list] : resources_) {
            for (const auto& res : list) fn(key, res);
        }
    }

    const std::map<std::string, ResourceList>& lists() const { return resources_; }

    void clear() { resources_.clear(); }

    // {"key": [resource, ...], ...}
    json to_json() const {
        json j = json::object();
        for (const auto& [key, list] : resources_) {
            json arr = json::array();
            for (const auto& res : list) arr.push_back(res->to_json());
            j[key] = std::move(arr);
        }
        return j;
    }

    // {"key": [id, ...], ...}
    json ids_json() const {
        json j = json::object();
        for (const auto& [key, list] : resources_) {
            json arr = json::array();
            for (const auto& res : list) arr.push_back(res->id());
            j[key] = std::move(arr);
        }
        return j;
    }

    // Accepts {"key": [payload, ...]} or a flat array of payloads keyed by type.
    // Defined in factory.hpp.
    static Status from_json(const json& j, const ResourceFactory& factory, ResourceMap& out);

private:
    std::map<std::string, ResourceList> resources_;
};

} // namespace zebra
