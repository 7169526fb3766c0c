#pragma once
// Resources: typed, identity-bearing entities carrying key/value labels
//
// The index never constructs or mutates resources. It only holds shared
// references to objects the caller built (usually through ResourceFactory)
// and reads them through this interface.

#include "status.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

namespace zebra {

using json = nlohmann::json;

// Label key -> label value. Keys are unique by construction.
using Labels = std::map<std::string, std::string>;

class Resource {
public:
    virtual ~Resource() = default;

    // Stable, globally unique identifier
    virtual const std::string& id() const = 0;

    // Type tag, as registered with the factory
    virtual const std::string& type() const = 0;

    virtual const Labels& labels() const = 0;

    // Self-validation; must not depend on index state
    virtual Status validate() const = 0;

    virtual json to_json() const = 0;
    virtual Status from_json(const json& j) = 0;
};

using ResourcePtr = std::shared_ptr<Resource>;

// Common fields every concrete type shares; derived types extend
// validate/to_json/from_json and call the base versions first.
class BaseResource : public Resource {
public:
    BaseResource() = default;

    BaseResource(std::string id, std::string type, Labels labels = {}, std::string name = "")
        : id_(std::move(id)), type_(std::move(type)),
          name_(std::move(name)), labels_(std::move(labels)) {}

    const std::string& id() const override { return id_; }
    const std::string& type() const override { return type_; }
    const Labels& labels() const override { return labels_; }
    const std::string& name() const { return name_; }

    void set_id(std::string id) { id_ = std::move(id); }
    void set_type(std::string type) { type_ = std::move(type); }
    void set_name(std::string name) { name_ = std::move(name); }
    void set_label(const std::string& key, std::string value) { labels_[key] = std::move(value); }

    Status validate() const override {
        if (id_.empty()) {
            return Status::fail(Errc::ValidationFailed, "resource id is empty");
        }
        if (type_.empty()) {
            return Status::fail(Errc::ValidationFailed, "resource " + id_ + " has no type");
        }
        for (const auto& [key, value] : labels_) {
            if (key.empty()) {
                return Status::fail(Errc::ValidationFailed,
                                    "resource " + id_ + " has a label with an empty key");
            }
        }
        return Status::ok();
    }

    json to_json() const override {
        json j = {
            {"id", id_},
            {"type", type_},
            {"labels", labels_}
        };
        if (!name_.empty()) j["name"] = name_;
        return j;
    }

    Status from_json(const json& j) override {
        if (!j.is_object()) {
            return Status::fail(Errc::ValidationFailed, "resource payload is not an object");
        }
        try {
            id_ = j.value("id", std::string());
            type_ = j.value("type", std::string());
            name_ = j.value("name", std::string());
            labels_.clear();
            if (j.contains("labels") && !j["labels"].is_null()) {
                labels_ = j["labels"].get<Labels>();
            }
        } catch (const json::exception& e) {
            return Status::fail(Errc::ValidationFailed,
                                std::string("malformed resource payload: ") + e.what());
        }
        return Status::ok();
    }

private:
    std::string id_;
    std::string type_;
    std::string name_;
    Labels labels_;
};

} // namespace zebra
