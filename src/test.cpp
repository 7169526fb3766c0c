#include <zebra/zebra.hpp>
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <limits>
#include <new>
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace zebra;

// Typed resource with one extra field and its own validation rule
class Vlan : public BaseResource {
public:
    Vlan() = default;
    Vlan(std::string id, int vlan_id, Labels labels = {})
        : BaseResource(std::move(id), "VLAN", std::move(labels)), vlan_id_(vlan_id) {}

    int vlan_id() const { return vlan_id_; }

    Status validate() const override {
        if (Status status = BaseResource::validate(); !status) return status;
        if (vlan_id_ < 1 || vlan_id_ > 4094) {
            return Status::fail(Errc::ValidationFailed, "vlan id out of range: " + std::to_string(vlan_id_));
        }
        return Status::ok();
    }

    json to_json() const override {
        json j = BaseResource::to_json();
        j["vlan_id"] = vlan_id_;
        return j;
    }

    Status from_json(const json& j) override {
        if (Status status = BaseResource::from_json(j); !status) return status;
        try {
            vlan_id_ = j.value("vlan_id", 0);
        } catch (const json::exception& e) {
            return Status::fail(Errc::ValidationFailed, e.what());
        }
        return Status::ok();
    }

private:
    int vlan_id_ = 0;
};

// Resource whose labels cannot be copied out, as under memory exhaustion
class Unstageable : public BaseResource {
public:
    using BaseResource::BaseResource;

    const Labels& labels() const override { throw std::bad_alloc(); }
};

std::shared_ptr<BaseResource> make_res(const std::string& id, Labels labels,
                                       const std::string& type = "Server") {
    return std::make_shared<BaseResource>(id, type, std::move(labels));
}

std::set<std::string> ids_of(const ResourceMap& map) {
    std::set<std::string> ids;
    map.for_each([&](const std::string&, const ResourcePtr& res) { ids.insert(res->id()); });
    return ids;
}

std::set<std::string> query_ids(const LabelStore& store, const Query& q) {
    auto result = store.query(q);
    assert(result.has_value());
    return ids_of(*result);
}

void test_status() {
    std::cout << "Testing Status..." << std::endl;

    Status ok = Status::ok();
    assert(ok.is_ok());
    assert(static_cast<bool>(ok));

    Status err = Status::fail(Errc::AlreadyExists, "resource a already exists");
    assert(!err);
    assert(err.code == Errc::AlreadyExists);
    assert(err.describe() == "already_exists: resource a already exists");
    assert(std::string(errc_name(Errc::InvalidQuery)) == "invalid_query");

    std::cout << "  PASS" << std::endl;
}

void test_query_validate() {
    std::cout << "Testing Query validation..." << std::endl;

    assert(Query::equal("rack", "7").validate().is_ok());
    assert(Query::in("rack", {"7", "8"}).validate().is_ok());

    Query two_values{Operator::MatchEqual, "rack", {"7", "8"}};
    assert(!two_values.well_formed());
    assert(two_values.validate().code == Errc::InvalidQuery);

    Query no_values{Operator::MatchNotEqual, "rack", {}};
    assert(!no_values.well_formed());
    assert(no_values.validate().code == Errc::InvalidQuery);

    // Well formed for the index, but rejected at request level
    Query empty_in = Query::in("rack", {});
    assert(empty_in.well_formed());
    assert(empty_in.validate().code == Errc::InvalidQuery);
    assert(Query::equal("", "7").validate().code == Errc::InvalidQuery);

    Query bogus{static_cast<Operator>(9), "rack", {"7"}};
    assert(!bogus.well_formed());
    assert(bogus.validate().code == Errc::InvalidQuery);

    assert(Query::in("rack", {"7", "8"}).to_string() == "rack in (7, 8)");
    assert(Query::not_equal("rack", "7").to_string() == "rack != 7");

    std::cout << "  PASS" << std::endl;
}

void test_query_json() {
    std::cout << "Testing Query JSON..." << std::endl;

    Query q;
    assert(Query::from_json(json::parse(R"({"op": "MatchNotIn", "key": "rack", "values": ["7"]})"), q).is_ok());
    assert(q.op == Operator::MatchNotIn);
    assert(q.key == "rack");
    assert(q.values.size() == 1);

    // Numeric wire codes and short forms
    assert(Query::from_json(json::parse(R"({"op": 2, "key": "row", "values": ["a", "b"]})"), q).is_ok());
    assert(q.op == Operator::MatchIn);
    assert(Query::from_json(json::parse(R"({"op": "!=", "key": "row", "values": ["a"]})"), q).is_ok());
    assert(q.op == Operator::MatchNotEqual);

    assert(Query::from_json(json::parse(R"({"op": "like", "key": "row"})"), q).code == Errc::InvalidQuery);
    assert(Query::from_json(json::parse(R"({"key": "row"})"), q).code == Errc::InvalidQuery);
    assert(Query::from_json(json::parse(R"({"op": 0, "key": "row", "values": [1]})"), q).code == Errc::InvalidQuery);

    // Wire codes outside 0..3 never wrap onto a valid operator
    assert(Query::from_json(json::parse(R"({"op": 4, "key": "row", "values": ["a"]})"), q).code == Errc::InvalidQuery);
    assert(Query::from_json(json::parse(R"({"op": -1, "key": "row", "values": ["a"]})"), q).code == Errc::InvalidQuery);
    assert(Query::from_json(json::parse(R"({"op": 4294967298, "key": "row", "values": ["a"]})"), q).code == Errc::InvalidQuery);
    assert(Query::from_json(json::parse(R"({"op": -4294967294, "key": "row", "values": ["a"]})"), q).code == Errc::InvalidQuery);

    Query back;
    assert(Query::from_json(Query::equal("rack", "7").to_json(), back).is_ok());
    assert(back.op == Operator::MatchEqual && back.values.front() == "7");

    std::cout << "  PASS" << std::endl;
}

void test_resource_validate() {
    std::cout << "Testing Resource validation..." << std::endl;

    assert(make_res("a", {{"rack", "7"}})->validate().is_ok());
    assert(make_res("", {})->validate().code == Errc::ValidationFailed);
    assert(make_res("a", {}, "")->validate().code == Errc::ValidationFailed);
    assert(make_res("a", {{"", "7"}})->validate().code == Errc::ValidationFailed);

    Vlan good("v1", 100);
    Vlan bad("v2", 5000);
    assert(good.validate().is_ok());
    assert(bad.validate().code == Errc::ValidationFailed);

    std::cout << "  PASS" << std::endl;
}

void test_factory() {
    std::cout << "Testing ResourceFactory..." << std::endl;

    ResourceFactory factory = ResourceFactory::with_defaults();
    factory.add("VLAN", [] { return std::make_shared<Vlan>(); });
    assert(factory.knows("VLAN"));
    assert(factory.make("Nope") == nullptr);

    Status status;
    auto res = factory.decode(std::string(R"({"type": "VLAN", "id": "v7", "vlan_id": 7, "labels": {"site": "ams"}})"), status);
    assert(res && status.is_ok());
    assert(res->type() == "VLAN");
    assert(res->labels().at("site") == "ams");
    assert(std::dynamic_pointer_cast<Vlan>(res)->vlan_id() == 7);

    assert(factory.decode(std::string(R"({"type": "Nope", "id": "x"})"), status) == nullptr);
    assert(status.code == Errc::ValidationFailed);
    assert(factory.decode(std::string(R"({"id": "x"})"), status) == nullptr);
    assert(factory.decode(std::string("{not json"), status) == nullptr);
    assert(factory.decode(std::string(R"({"type": "BaseResource", "id": "x", "labels": {"n": 1}})"), status) == nullptr);

    factory.set_fallback([] { return std::make_shared<BaseResource>(); });
    res = factory.decode(std::string(R"({"type": "Nope", "id": "x"})"), status);
    assert(res && res->type() == "Nope");

    ResourceMap map;
    json doc = json::parse(R"({"VLAN": [{"type": "VLAN", "id": "v1", "vlan_id": 1}],
                               "Nope": [{"type": "Nope", "id": "n1"}, {"type": "Nope", "id": "n2"}]})");
    assert(ResourceMap::from_json(doc, factory, map).is_ok());
    assert(map.size() == 2 && map.total() == 3);

    assert(ResourceMap::from_json(json::parse(R"([{"type": "VLAN", "id": "v1"}, {"type": "X", "id": "x1"}])"),
                                  factory, map).is_ok());
    assert(map.find("VLAN") && map.find("X"));
    assert(ResourceMap::from_json(json::parse(R"({"VLAN": 3})"), factory, map).code == Errc::ValidationFailed);

    std::cout << "  PASS" << std::endl;
}

void test_resource_map() {
    std::cout << "Testing ResourceMap..." << std::endl;

    ResourceMap map;
    auto a = make_res("a", {});
    auto b = make_res("b", {});
    map.add(a, "Server");
    map.add(b, "Server");
    assert(map.size() == 1 && map.total() == 2);

    // Removal is by identifier, not by pointer
    map.remove(make_res("a", {{"x", "y"}}), "Server");
    assert(map.find("Server")->size() == 1);
    assert(map.find("Switch") == nullptr);

    ResourceList copy;
    copy_resource_list(copy, *map.find("Server"));
    copy.push_back(a);
    assert(map.find("Server")->size() == 1);
    assert(copy.front() == b);

    assert(map.ids_json()["Server"][0] == "b");

    std::cout << "  PASS" << std::endl;
}

void test_lifecycle() {
    std::cout << "Testing LabelStore lifecycle..." << std::endl;

    LabelStore store;
    assert(!store.ready());
    assert(store.create(make_res("a", {{"rack", "7"}})).code == Errc::Uninitialized);
    assert(store.update(make_res("a", {})).code == Errc::Uninitialized);
    assert(store.remove(make_res("a", {})).code == Errc::Uninitialized);
    assert(!store.query(Query::equal("rack", "7")).has_value());
    ResourceMap out;
    assert(store.load(out).code == Errc::Uninitialized);
    assert(store.size() == 0);

    assert(store.initialize().is_ok());
    assert(store.ready());
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());

    // Idempotent: existing content survives
    assert(store.initialize().is_ok());
    assert(store.contains("a"));

    assert(store.wipe().is_ok());
    assert(!store.ready());
    assert(store.create(make_res("b", {})).code == Errc::Uninitialized);
    assert(!store.query(Query::in("rack", {"7"})).has_value());

    assert(store.clear().is_ok());
    assert(store.ready());
    assert(store.size() == 0);
    assert(query_ids(store, Query::equal("rack", "7")).empty());

    // Clear on a populated store empties it but keeps it operable
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());
    assert(store.clear().is_ok());
    assert(!store.contains("a"));
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());

    std::cout << "  PASS" << std::endl;
}

void test_create_uniqueness() {
    std::cout << "Testing create uniqueness..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    auto first = make_res("a", {{"rack", "7"}});
    assert(store.create(first).is_ok());

    ResourceMap before;
    assert(store.load(before).is_ok());

    auto again = make_res("a", {{"rack", "9"}, {"row", "b"}});
    assert(store.create(again).code == Errc::AlreadyExists);

    ResourceMap after;
    assert(store.load(after).is_ok());
    assert(store.size() == 1);
    assert(before.keys() == after.keys());
    assert(store.find("a") == first);
    assert(query_ids(store, Query::equal("rack", "9")).empty());
    assert(query_ids(store, Query::equal("row", "b")).empty());
    assert(query_ids(store, Query::equal("rack", "7")) == std::set<std::string>{"a"});

    std::cout << "  PASS" << std::endl;
}

void test_validation_before_mutation() {
    std::cout << "Testing validation before mutation..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(std::make_shared<Vlan>("v1", 0, Labels{{"site", "ams"}})).code == Errc::ValidationFailed);
    assert(store.size() == 0);
    assert(store.stats().buckets == 0);
    assert(store.create(nullptr).code == Errc::ValidationFailed);

    assert(store.create(std::make_shared<Vlan>("v1", 10, Labels{{"site", "ams"}})).is_ok());
    assert(store.update(std::make_shared<Vlan>("v1", 9999, Labels{{"site", "fra"}})).code == Errc::ValidationFailed);
    assert(query_ids(store, Query::equal("site", "ams")) == std::set<std::string>{"v1"});
    assert(store.remove(std::make_shared<Vlan>("v1", -1)).code == Errc::ValidationFailed);
    assert(store.contains("v1"));

    std::cout << "  PASS" << std::endl;
}

void test_update_missing() {
    std::cout << "Testing update of a missing resource..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());

    Status status = store.update(make_res("ghost", {{"rack", "7"}}));
    assert(status.code == Errc::NotFound);
    assert(store.size() == 1);
    assert(!store.contains("ghost"));
    assert(query_ids(store, Query::equal("rack", "7")) == std::set<std::string>{"a"});

    std::cout << "  PASS" << std::endl;
}

void test_update_migrates_labels() {
    std::cout << "Testing update label migration..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}, {"row", "b"}})).is_ok());
    assert(store.create(make_res("b", {{"rack", "7"}})).is_ok());

    auto replacement = make_res("a", {{"rack", "8"}, {"owner", "net"}});
    assert(store.update(replacement).is_ok());

    assert(store.size() == 2);
    assert(store.find("a") == replacement);
    assert(query_ids(store, Query::equal("rack", "7")) == std::set<std::string>{"b"});
    assert(query_ids(store, Query::equal("row", "b")).empty());
    assert(query_ids(store, Query::equal("rack", "8")) == std::set<std::string>{"a"});
    assert(query_ids(store, Query::equal("owner", "net")) == std::set<std::string>{"a"});

    // Same labels: membership kept
    assert(store.update(make_res("b", {{"rack", "7"}})).is_ok());
    assert(query_ids(store, Query::equal("rack", "7")) == std::set<std::string>{"b"});

    std::cout << "  PASS" << std::endl;
}

void test_update_after_in_place_edit() {
    std::cout << "Testing update after in-place label edit..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    auto res = make_res("a", {{"rack", "7"}});
    assert(store.create(res).is_ok());

    // Caller edits the shared object, then hands the same object back
    res->set_label("rack", "8");
    assert(store.update(res).is_ok());

    assert(query_ids(store, Query::equal("rack", "7")).empty());
    assert(query_ids(store, Query::equal("rack", "8")) == std::set<std::string>{"a"});

    std::cout << "  PASS" << std::endl;
}

void test_delete_idempotent() {
    std::cout << "Testing delete idempotence..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());

    assert(store.remove(make_res("ghost", {{"rack", "7"}})).is_ok());
    assert(store.size() == 1);
    assert(query_ids(store, Query::equal("rack", "7")) == std::set<std::string>{"a"});

    assert(store.remove(make_res("a", {})).is_ok());
    assert(store.remove(make_res("a", {})).is_ok());
    assert(store.size() == 0);
    assert(store.find("a") == nullptr);

    std::cout << "  PASS" << std::endl;
}

void test_index_consistency() {
    std::cout << "Testing index consistency..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    std::vector<std::shared_ptr<BaseResource>> all;
    for (int i = 0; i < 50; ++i) {
        Labels labels = {
            {"rack", std::to_string(i % 5)},
            {"row", std::to_string(i % 3)},
            {"id", std::to_string(i)}
        };
        all.push_back(make_res("r" + std::to_string(i), labels));
        assert(store.create(all.back()).is_ok());
    }

    for (const auto& res : all) {
        for (const auto& [key, value] : res->labels()) {
            assert(query_ids(store, Query::equal(key, value)).count(res->id()) == 1);
        }
    }

    for (size_t i = 0; i < all.size(); i += 2) {
        assert(store.remove(all[i]).is_ok());
    }

    for (size_t i = 0; i < all.size(); ++i) {
        for (const auto& [key, value] : all[i]->labels()) {
            bool present = query_ids(store, Query::equal(key, value)).count(all[i]->id()) == 1;
            assert(present == (i % 2 == 1));
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_rack_scenario() {
    std::cout << "Testing rack scenario..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    auto a = make_res("a", {{"rack", "7"}});
    auto b = make_res("b", {{"rack", "8"}});
    assert(store.create(a).is_ok());
    assert(store.create(b).is_ok());

    assert(query_ids(store, Query::equal("rack", "7")) == std::set<std::string>{"a"});
    assert(query_ids(store, Query::in("rack", {"7", "8"})) == (std::set<std::string>{"a", "b"}));
    assert(query_ids(store, Query::not_in("rack", {"7"})) == std::set<std::string>{"b"});
    assert(query_ids(store, Query::not_equal("rack", "8")) == std::set<std::string>{"a"});

    assert(store.remove(a).is_ok());
    auto result = store.query(Query::equal("rack", "7"));
    assert(result.has_value() && result->empty());

    std::cout << "  PASS" << std::endl;
}

void test_in_notin_complement() {
    std::cout << "Testing MatchIn/MatchNotIn complement..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    std::set<std::string> with_key;
    for (int i = 0; i < 30; ++i) {
        Labels labels = {{"zone", "z" + std::to_string(i % 6)}};
        if (i % 4 == 0) labels.erase("zone");  // some resources lack the key
        labels["n"] = std::to_string(i);
        std::string id = "r" + std::to_string(i);
        if (labels.count("zone")) with_key.insert(id);
        assert(store.create(make_res(id, labels)).is_ok());
    }

    std::vector<std::string> values = {"z0", "z3", "z5", "missing"};
    auto in = query_ids(store, Query::in("zone", values));
    auto not_in = query_ids(store, Query::not_in("zone", values));

    std::set<std::string> both;
    both.insert(in.begin(), in.end());
    both.insert(not_in.begin(), not_in.end());
    assert(both == with_key);
    for (const auto& id : in) assert(not_in.count(id) == 0);

    // Empty value sets are well formed for the index
    assert(query_ids(store, Query::in("zone", {})).empty());
    assert(query_ids(store, Query::not_in("zone", {})) == with_key);

    // Duplicate candidates do not duplicate results
    auto dup = store.query(Query::in("zone", {"z1", "z1"}));
    assert(dup && dup->total() == ids_of(*dup).size());

    std::cout << "  PASS" << std::endl;
}

void test_unknown_key() {
    std::cout << "Testing unknown key lookups..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());

    for (const auto& q : {Query::in("nonexistent-key", {"x"}),
                          Query::equal("nonexistent-key", "x"),
                          Query::not_in("nonexistent-key", {"x"}),
                          Query::not_equal("nonexistent-key", "x"),
                          Query::in("rack", {"no-such-value"})}) {
        auto result = store.query(q);
        assert(result.has_value());
        assert(result->empty());
    }

    std::cout << "  PASS" << std::endl;
}

void test_malformed_queries() {
    std::cout << "Testing malformed queries..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());

    assert(!store.query(Query{Operator::MatchEqual, "rack", {}}).has_value());
    assert(!store.query(Query{Operator::MatchEqual, "rack", {"7", "8"}}).has_value());
    assert(!store.query(Query{Operator::MatchNotEqual, "rack", {"7", "8"}}).has_value());
    assert(!store.query(Query{static_cast<Operator>(42), "rack", {"7"}}).has_value());

    assert(!store.query_all({}).has_value());
    assert(!store.query_all({Query::equal("rack", "7"), Query{Operator::MatchEqual, "rack", {}}}).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_results_keyed_by_type() {
    std::cout << "Testing results keyed by type..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    auto server = make_res("s1", {{"site", "ams"}}, "Server");
    auto sw = make_res("sw1", {{"site", "ams"}}, "Switch");
    auto vlan = std::make_shared<Vlan>("v1", 12, Labels{{"site", "ams"}});
    assert(store.create(server).is_ok());
    assert(store.create(sw).is_ok());
    assert(store.create(vlan).is_ok());

    auto result = store.query(Query::equal("site", "ams"));
    assert(result && result->size() == 3);
    assert(result->find("Server")->front() == server);
    assert(result->find("Switch")->front() == sw);
    assert(result->find("VLAN")->front() == vlan);

    // Shared references, not copies
    assert(result->find("VLAN")->front().get() == vlan.get());

    std::cout << "  PASS" << std::endl;
}

void test_query_all() {
    std::cout << "Testing query_all conjunction..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}, {"row", "b"}})).is_ok());
    assert(store.create(make_res("b", {{"rack", "7"}, {"row", "c"}})).is_ok());
    assert(store.create(make_res("c", {{"rack", "8"}, {"row", "b"}})).is_ok());
    assert(store.create(make_res("d", {{"rack", "9"}})).is_ok());

    auto r = store.query_all({Query::equal("rack", "7"), Query::equal("row", "b")});
    assert(r && ids_of(*r) == std::set<std::string>{"a"});

    r = store.query_all({Query::in("rack", {"7", "8"}), Query::not_equal("row", "c")});
    assert(r && ids_of(*r) == (std::set<std::string>{"a", "c"}));

    r = store.query_all({Query::equal("rack", "9"), Query::equal("row", "b")});
    assert(r && r->empty());

    r = store.query_all({Query::not_in("rack", {"8"})});
    assert(r && ids_of(*r) == (std::set<std::string>{"a", "b", "d"}));

    std::cout << "  PASS" << std::endl;
}

void test_load_export() {
    std::cout << "Testing load export..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}, {"row", "b"}})).is_ok());
    assert(store.create(make_res("b", {{"rack", "7"}})).is_ok());
    assert(store.create(make_res("c", {{"rack", "8"}})).is_ok());
    assert(store.create(make_res("d", {{"owner", "ops"}})).is_ok());
    assert(store.remove(make_res("d", {})).is_ok());

    ResourceMap exported;
    assert(store.load(exported).is_ok());

    // rack=7, rack=8, row=b; the emptied owner=ops bucket is not exported
    assert(exported.size() == 3);
    assert(ids_of(exported) == (std::set<std::string>{"a", "b", "c"}));
    assert(exported.find("rack = 7")->size() == 2);
    assert(exported.find("rack = 8")->size() == 1);
    assert(exported.find("row = b")->front()->id() == "a");
    assert(exported.find("owner = ops") == nullptr);

    // Mutating the export leaves the index alone
    exported.find("rack = 7")->clear();
    exported.find("rack = 8")->push_back(make_res("z", {}));
    assert(query_ids(store, Query::equal("rack", "7")) == (std::set<std::string>{"a", "b"}));
    assert(query_ids(store, Query::equal("rack", "8")) == std::set<std::string>{"c"});

    ResourceMap again;
    assert(store.load(again).is_ok());
    assert(again.find("rack = 7")->size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_snapshot_seeding() {
    std::cout << "Testing snapshot seeding..." << std::endl;

    ResourceMap snapshot;
    auto a = make_res("a", {{"rack", "7"}});
    snapshot.add(a, "Server");
    snapshot.add(make_res("b", {{"rack", "8"}}), "Server");
    snapshot.add(make_res("a", {{"rack", "9"}}), "Switch");   // repeated id
    snapshot.add(make_res("", {{"rack", "7"}}), "Server");    // invalid

    LabelStore store(snapshot);
    assert(store.ready());
    assert(store.size() == 2);
    assert(store.find("a") == a);
    assert(query_ids(store, Query::equal("rack", "9")).empty());
    assert(query_ids(store, Query::in("rack", {"7", "8"})) == (std::set<std::string>{"a", "b"}));

    // initialize() keeps seeded content
    assert(store.initialize().is_ok());
    assert(store.size() == 2);

    // Null references are dropped by put() and skipped while seeding
    ResourceMap holes;
    holes.put("Server", {nullptr, make_res("c", {{"rack", "7"}})});
    assert(holes.find("Server")->size() == 1);
    holes.find("Server")->push_back(nullptr);

    LabelStore patched(holes);
    assert(patched.size() == 1);
    assert(query_ids(patched, Query::equal("rack", "7")) == (std::set<std::string>{"c"}));

    std::cout << "  PASS" << std::endl;
}

void test_prune_empty_buckets() {
    std::cout << "Testing empty bucket pruning..." << std::endl;

    LabelStore keep;
    assert(keep.initialize().is_ok());
    assert(keep.create(make_res("a", {{"rack", "7"}})).is_ok());
    assert(keep.remove(make_res("a", {})).is_ok());
    auto s = keep.stats();
    assert(s.buckets == 1 && s.empty_buckets == 1 && s.label_keys == 1);
    assert(query_ids(keep, Query::not_in("rack", {"x"})).empty());

    LabelStoreConfig config;
    config.prune_empty_buckets = true;
    LabelStore prune(config);
    assert(prune.initialize().is_ok());
    assert(prune.create(make_res("a", {{"rack", "7"}, {"row", "b"}})).is_ok());
    assert(prune.create(make_res("b", {{"rack", "7"}})).is_ok());
    assert(prune.update(make_res("a", {{"rack", "7"}})).is_ok());
    s = prune.stats();
    assert(s.label_keys == 1 && s.buckets == 1 && s.empty_buckets == 0);

    assert(prune.remove(make_res("a", {})).is_ok());
    assert(prune.remove(make_res("b", {})).is_ok());
    s = prune.stats();
    assert(s.label_keys == 0 && s.buckets == 0);

    std::cout << "  PASS" << std::endl;
}

void test_slot_recycling() {
    std::cout << "Testing slot recycling..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    for (int i = 0; i < 10; ++i) {
        assert(store.create(make_res("r" + std::to_string(i), {{"gen", "1"}})).is_ok());
    }
    for (int i = 0; i < 10; i += 3) {
        assert(store.remove(make_res("r" + std::to_string(i), {})).is_ok());
    }
    for (int i = 0; i < 4; ++i) {
        assert(store.create(make_res("n" + std::to_string(i), {{"gen", "2"}})).is_ok());
    }

    assert(store.size() == 10);
    assert(query_ids(store, Query::equal("gen", "1")).size() == 6);
    assert(query_ids(store, Query::equal("gen", "2")) == (std::set<std::string>{"n0", "n1", "n2", "n3"}));
    assert(store.stats().postings == 10);

    std::cout << "  PASS" << std::endl;
}

void test_filter_label() {
    std::cout << "Testing filter_label..." << std::endl;

    ResourceMap listing;
    auto a = make_res("a", {{"rack", "7"}, {"row", "b"}});
    auto b = make_res("b", {{"rack", "8"}});
    auto c = make_res("c", {{"row", "b"}}, "Switch");
    listing.add(a, "Server");
    listing.add(b, "Server");
    listing.add(c, "Switch");
    listing.add(a, "rack = 7");   // same resource under a second key

    auto r = filter_label(Query::equal("rack", "7"), listing);
    assert(r && r->total() == 1 && r->find("Server")->front() == a);

    // Missing key never matches, even for negative operators
    r = filter_label(Query::not_equal("rack", "7"), listing);
    assert(r && ids_of(*r) == std::set<std::string>{"b"});

    r = filter_labels({Query::equal("row", "b"), Query::in("rack", {"7", "8"})}, listing);
    assert(r && ids_of(*r) == std::set<std::string>{"a"});

    assert(!filter_label(Query{Operator::MatchEqual, "rack", {}}, listing).has_value());

    // Same answer as the index for the same data
    LabelStore store;
    assert(store.initialize().is_ok());
    for (const auto& res : {a, b, c}) assert(store.create(res).is_ok());
    for (const auto& q : {Query::not_in("row", {"x"}), Query::in("rack", {"8"}), Query::not_equal("rack", "8")}) {
        assert(ids_of(*filter_label(q, listing)) == query_ids(store, q));
    }

    std::cout << "  PASS" << std::endl;
}

void test_config_from_env() {
    std::cout << "Testing LabelStoreConfig from environment..." << std::endl;

    setenv("ZEBRA_PRUNE_EMPTY_BUCKETS", "yes", 1);
    setenv("ZEBRA_EXPECTED_RESOURCES", "2048", 1);
    setenv("ZEBRA_VERBOSE", "bogus", 1);

    LabelStoreConfig config = LabelStoreConfig::from_env();
    assert(config.prune_empty_buckets);
    assert(config.expected_resources == 2048);
    assert(!config.verbose);   // unrecognised value keeps the default

    setenv("ZEBRA_EXPECTED_RESOURCES", "12abc", 1);
    LabelStoreConfig base;
    base.expected_resources = 5;
    assert(LabelStoreConfig::from_env(base).expected_resources == 5);

    unsetenv("ZEBRA_PRUNE_EMPTY_BUCKETS");
    unsetenv("ZEBRA_EXPECTED_RESOURCES");
    unsetenv("ZEBRA_VERBOSE");
    assert(!LabelStoreConfig::from_env().prune_empty_buckets);

    LabelStore store(config);
    assert(store.initialize().is_ok());
    assert(store.config().expected_resources == 2048);

    std::cout << "  PASS" << std::endl;
}

void test_config_reserve_hint() {
    std::cout << "Testing reserve hint bounds..." << std::endl;

    setenv("ZEBRA_EXPECTED_RESOURCES", "-1", 1);
    assert(LabelStoreConfig::from_env().expected_resources == 0);
    setenv("ZEBRA_EXPECTED_RESOURCES", " 12", 1);
    assert(LabelStoreConfig::from_env().expected_resources == 0);
    setenv("ZEBRA_EXPECTED_RESOURCES", "99999999999999999999999", 1);
    assert(LabelStoreConfig::from_env().expected_resources == 0);
    setenv("ZEBRA_EXPECTED_RESOURCES", "18446744073709551615", 1);
    assert(LabelStoreConfig::from_env().expected_resources == LabelStoreConfig::MAX_EXPECTED_RESOURCES);
    unsetenv("ZEBRA_EXPECTED_RESOURCES");

    // A hint no vector can hold is ignored rather than thrown
    LabelStoreConfig huge;
    huge.expected_resources = std::numeric_limits<size_t>::max();

    LabelStore store(huge);
    assert(store.initialize().is_ok());
    assert(store.create(make_res("a", {{"rack", "7"}})).is_ok());
    assert(store.clear().is_ok());
    assert(store.size() == 0);

    ResourceMap snapshot;
    snapshot.add(make_res("b", {{"rack", "8"}}), "Server");
    LabelStore seeded(snapshot, huge);
    assert(seeded.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_staging_failure() {
    std::cout << "Testing staging failure..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    auto a = make_res("a", {{"rack", "7"}});
    assert(store.create(a).is_ok());

    auto broken = std::make_shared<Unstageable>("a", "Server", Labels{{"rack", "8"}});
    assert(store.update(broken).code == Errc::Internal);
    assert(store.find("a") == a);
    assert(query_ids(store, Query::equal("rack", "7")) == (std::set<std::string>{"a"}));
    assert(query_ids(store, Query::equal("rack", "8")).empty());

    size_t before = store.size();
    auto fresh = std::make_shared<Unstageable>("b", "Server", Labels{{"rack", "7"}});
    assert(store.create(fresh).code == Errc::Internal);
    assert(store.size() == before);
    assert(!store.contains("b"));

    // The identifier is still free
    assert(store.create(make_res("b", {{"rack", "7"}})).is_ok());
    assert(query_ids(store, Query::equal("rack", "7")) == (std::set<std::string>{"a", "b"}));

    std::cout << "  PASS" << std::endl;
}

void test_update_keeps_unchanged_labels() {
    std::cout << "Testing update with unchanged labels..." << std::endl;

    LabelStoreConfig config;
    config.prune_empty_buckets = true;
    LabelStore store(config);
    assert(store.initialize().is_ok());

    assert(store.create(make_res("a", {{"rack", "7"}, {"row", "a"}})).is_ok());
    assert(store.update(make_res("a", {{"rack", "7"}, {"row", "b"}})).is_ok());

    assert(query_ids(store, Query::equal("rack", "7")) == (std::set<std::string>{"a"}));
    assert(query_ids(store, Query::equal("row", "b")) == (std::set<std::string>{"a"}));
    assert(query_ids(store, Query::equal("row", "a")).empty());

    auto s = store.stats();
    assert(s.buckets == 2);
    assert(s.postings == 2);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_writers_and_readers() {
    std::cout << "Testing concurrent writers and readers..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    constexpr int WRITERS = 4;
    constexpr int PER_WRITER = 250;

    std::atomic<bool> done{false};
    std::atomic<bool> inconsistent{false};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&, r] {
            std::string shard = std::to_string(r % WRITERS);
            while (!done) {
                auto result = store.query(Query::equal("shard", shard));
                if (!result) { inconsistent = true; return; }
                result->for_each([&](const std::string&, const ResourcePtr& res) {
                    if (res->labels().at("shard") != shard) inconsistent = true;
                });
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < WRITERS; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < PER_WRITER; ++i) {
                Labels labels = {{"shard", std::to_string(w)}, {"parity", i % 2 ? "odd" : "even"}};
                if (!store.create(make_res("w" + std::to_string(w) + "-" + std::to_string(i), labels))) {
                    inconsistent = true;
                }
            }
            for (int i = 1; i < PER_WRITER; i += 2) {
                if (!store.remove(make_res("w" + std::to_string(w) + "-" + std::to_string(i), {}))) {
                    inconsistent = true;
                }
            }
        });
    }

    for (auto& t : writers) t.join();
    done = true;
    for (auto& t : readers) t.join();

    assert(!inconsistent);
    assert(store.size() == WRITERS * PER_WRITER / 2);
    for (int w = 0; w < WRITERS; ++w) {
        assert(query_ids(store, Query::equal("shard", std::to_string(w))).size() == PER_WRITER / 2);
    }
    assert(query_ids(store, Query::equal("parity", "odd")).empty());

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_update_never_absent() {
    std::cout << "Testing update visibility under concurrency..." << std::endl;

    LabelStore store;
    assert(store.initialize().is_ok());
    assert(store.create(make_res("flip", {{"side", "left"}})).is_ok());

    std::atomic<bool> done{false};
    std::atomic<int> bad_reads{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&] {
            while (!done) {
                auto result = store.query(Query::in("side", {"left", "right"}));
                if (!result || result->total() != 1) ++bad_reads;

                ResourceMap exported;
                if (!store.load(exported) || exported.total() != 1) ++bad_reads;
            }
        });
    }

    for (int i = 0; i < 2000; ++i) {
        const char* side = i % 2 ? "left" : "right";
        assert(store.update(make_res("flip", {{"side", side}})).is_ok());
    }
    done = true;
    for (auto& t : readers) t.join();

    assert(bad_reads == 0);
    assert(query_ids(store, Query::equal("side", "left")) == std::set<std::string>{"flip"});

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Zebra Label Index Tests ===" << std::endl;
    std::cout << "version " << ZEBRA_VERSION << std::endl;
    std::cout << std::endl;

    test_status();
    test_query_validate();
    test_query_json();
    test_resource_validate();
    test_factory();
    test_resource_map();

    std::cout << std::endl;
    std::cout << "=== LabelStore ===" << std::endl;
    test_lifecycle();
    test_create_uniqueness();
    test_validation_before_mutation();
    test_update_missing();
    test_update_migrates_labels();
    test_update_after_in_place_edit();
    test_delete_idempotent();
    test_index_consistency();
    test_rack_scenario();
    test_in_notin_complement();
    test_unknown_key();
    test_malformed_queries();
    test_results_keyed_by_type();
    test_query_all();
    test_load_export();
    test_snapshot_seeding();
    test_prune_empty_buckets();
    test_slot_recycling();
    test_filter_label();
    test_config_from_env();
    test_config_reserve_hint();
    test_staging_failure();
    test_update_keeps_unchanged_labels();

    std::cout << std::endl;
    std::cout << "=== Concurrency ===" << std::endl;
    test_concurrent_writers_and_readers();
    test_concurrent_update_never_absent();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
