#pragma once
// ResourceFactory: type tag -> zero-value constructor
//
// Callers decode raw payloads through the factory before handing the
// resulting resource to the index. The index itself never calls it.

#include "resource.hpp"
#include "resource_map.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zebra {

class ResourceFactory {
public:
    using Constructor = std::function<ResourcePtr()>;

    // Factory with BaseResource registered under "BaseResource"
    static ResourceFactory with_defaults() {
        ResourceFactory factory;
        factory.add("BaseResource", [] { return std::make_shared<BaseResource>(); });
        return factory;
    }

    // Register (or replace) the constructor for a type tag
    void add(const std::string& type, Constructor ctor) {
        constructors_[type] = std::move(ctor);
    }

    // Constructor used for tags nobody registered (none by default)
    void set_fallback(Constructor ctor) {
        fallback_ = std::move(ctor);
    }

    bool knows(const std::string& type) const {
        return constructors_.find(type) != constructors_.end();
    }

    // Zero-value resource of the given type, or nullptr for unknown tags
    ResourcePtr make(const std::string& type) const {
        auto it = constructors_.find(type);
        if (it != constructors_.end()) return it->second();
        if (fallback_) return fallback_();
        return nullptr;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        out.reserve(constructors_.size());
        for (const auto& [type, ctor] : constructors_) out.push_back(type);
        return out;
    }

    // Construct a resource from a payload carrying a "type" tag.
    // Returns nullptr and sets status on failure. The result is not validated.
    ResourcePtr decode(const json& payload, Status& status) const {
        if (!payload.is_object()) {
            status = Status::fail(Errc::ValidationFailed, "resource payload is not an object");
            return nullptr;
        }

        auto type_it = payload.find("type");
        if (type_it == payload.end() || !type_it->is_string()) {
            status = Status::fail(Errc::ValidationFailed, "resource payload has no type tag");
            return nullptr;
        }

        const std::string type = type_it->get<std::string>();
        ResourcePtr res = make(type);
        if (!res) {
            status = Status::fail(Errc::ValidationFailed, "unknown resource type: " + type);
            return nullptr;
        }

        status = res->from_json(payload);
        if (!status) return nullptr;
        return res;
    }

    ResourcePtr decode(const std::string& text, Status& status) const {
        json payload;
        try {
            payload = json::parse(text);
        } catch (const json::parse_error& e) {
            status = Status::fail(Errc::ValidationFailed,
                                  std::string("JSON parse error: ") + e.what());
            return nullptr;
        }
        return decode(payload, status);
    }

private:
    std::map<std::string, Constructor> constructors_;
    Constructor fallback_;
};

inline Status ResourceMap::from_json(const json& j, const ResourceFactory& factory, ResourceMap& out) {
    out.clear();

    auto decode_into = [&](const json& payload, const std::string* key) -> Status {
        Status status;
        ResourcePtr res = factory.decode(payload, status);
        if (!res) return status;
        out.add(res, key ? *key : res->type());
        return Status::ok();
    };

    if (j.is_array()) {
        for (const auto& payload : j) {
            Status status = decode_into(payload, nullptr);
            if (!status) return status;
        }
        return Status::ok();
    }

    if (!j.is_object()) {
        return Status::fail(Errc::ValidationFailed, "resource map must be an object or an array");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string key = it.key();
        if (!it->is_array()) {
            return Status::fail(Errc::ValidationFailed, "resource list under '" + key + "' is not an array");
        }
        for (const auto& payload : *it) {
            Status status = decode_into(payload, &key);
            if (!status) return status;
        }
    }
    return Status::ok();
}

} // namespace zebra
