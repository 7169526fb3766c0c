// zebra: Command-line interface over a resource snapshot
//
// Usage: zebra <command> --snapshot FILE [options]
//
// Commands:
//   stats      Show label index statistics
//   export     Dump the label export ("key = value" -> resource ids)
//   query      Evaluate label queries (ANDed)
//   validate   Decode and validate every resource in the snapshot
//   help       Show this help

#include <zebra/zebra.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>

using namespace zebra;

static const char* COMPONENT = "zebra";

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "zebra " << ZEBRA_VERSION << " - Label index over resource snapshots\n\n"
              << "Usage: " << name << " <command> --snapshot FILE [options]\n\n"
              << "Commands:\n"
              << "  stats              Show label index statistics\n"
              << "  export             Dump \"key = value\" buckets with their resource ids\n"
              << "  query              Evaluate label queries (all must match)\n"
              << "  validate           Decode and validate every resource in the snapshot\n"
              << "  help               Show this help\n\n"
              << "Query options (repeatable):\n"
              << "  --eq KEY=VALUE     Label equals value\n"
              << "  --ne KEY=VALUE     Label differs from value\n"
              << "  --in KEY=V1,V2     Label is one of the values\n"
              << "  --notin KEY=V1,V2  Label is none of the values\n\n"
              << "Options:\n"
              << "  --snapshot FILE    JSON snapshot: array of resources or {key: [resources]}\n"
              << "  --json             Output as JSON\n"
              << "  --prune            Drop empty label buckets\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n"
              << "  -h, --help         Show this help\n\n"
              << "Environment: ZEBRA_VERBOSE, ZEBRA_PRUNE_EMPTY_BUCKETS, ZEBRA_EXPECTED_RESOURCES\n";
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(s);
    while (std::getline(in, current, sep)) {
        parts.push_back(current);
    }
    return parts;
}

// "rack=7,8" -> Query{op, "rack", {"7", "8"}}
static bool parse_selector(Operator op, const std::string& arg, Query& out) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) return false;

    out.op = op;
    out.key = arg.substr(0, eq);
    std::string rest = arg.substr(eq + 1);

    if (op == Operator::MatchEqual || op == Operator::MatchNotEqual) {
        out.values = {rest};
    } else {
        out.values = split(rest, ',');
    }
    return out.validate().is_ok();
}

static bool read_snapshot(const std::string& path, const ResourceFactory& factory,
                          ResourceMap& out, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "Cannot open snapshot file: " + path;
        return false;
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        error = std::string("JSON parse error in ") + path + ": " + e.what();
        return false;
    }

    Status status = ResourceMap::from_json(doc, factory, out);
    if (!status) {
        error = status.describe();
        return false;
    }
    return true;
}

int cmd_stats(const LabelStore& store, bool json_output) {
    auto s = store.stats();
    if (json_output) {
        json j = s.to_json();
        j["version"] = ZEBRA_VERSION;
        std::cout << j.dump() << "\n";
        return 0;
    }

    std::cout << "Label Index Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "  Resources:      " << s.resources << "\n";
    std::cout << "  Label keys:     " << s.label_keys << "\n";
    std::cout << "  Buckets:        " << s.buckets << "\n";
    std::cout << "  Empty buckets:  " << s.empty_buckets << "\n";
    std::cout << "  Memberships:    " << s.postings << "\n";
    std::cout << "  Memory (bytes): " << s.memory_bytes << "\n";
    return 0;
}

int cmd_export(const LabelStore& store, bool json_output) {
    ResourceMap exported;
    Status status = store.load(exported);
    if (!status) {
        std::cerr << "Error: " << status.describe() << "\n";
        return 1;
    }

    if (json_output) {
        json j = {
            {"format", {ZEBRA_EXPORT_FORMAT_MAJOR, ZEBRA_EXPORT_FORMAT_MINOR}},
            {"buckets", exported.ids_json()}
        };
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    for (const auto& [key, list] : exported.lists()) {
        std::cout << key << " (" << list.size() << ")\n";
        for (const auto& res : list) {
            std::cout << "  " << res->id() << "\n";
        }
    }
    return 0;
}

int cmd_query(const LabelStore& store, const std::vector<Query>& queries, bool json_output) {
    if (queries.empty()) {
        std::cerr << "Usage: zebra query --snapshot FILE (--eq|--ne|--in|--notin) SELECTOR ...\n";
        return 1;
    }

    for (const auto& q : queries) {
        log_debug(COMPONENT, "query: %s", q.to_string().c_str());
    }

    auto result = store.query_all(queries);
    if (!result) {
        std::cerr << "Error: invalid query\n";
        return 1;
    }

    if (json_output) {
        std::cout << result->to_json().dump(2) << "\n";
        return 0;
    }

    if (result->empty()) {
        std::cout << "No matches\n";
        return 0;
    }

    for (const auto& [type, list] : result->lists()) {
        std::cout << type << " (" << list.size() << ")\n";
        for (const auto& res : list) {
            std::cout << "  " << res->id();
            for (const auto& [key, value] : res->labels()) {
                std::cout << " " << key << "=" << value;
            }
            std::cout << "\n";
        }
    }
    return 0;
}

int cmd_validate(const ResourceMap& snapshot, bool json_output) {
    size_t valid = 0;
    json failures = json::array();

    snapshot.for_each([&](const std::string&, const ResourcePtr& res) {
        if (!res) return;
        Status status = res->validate();
        if (status) {
            ++valid;
        } else {
            failures.push_back({{"id", res->id()}, {"error", status.describe()}});
        }
    });

    if (json_output) {
        std::cout << json{{"valid", valid}, {"invalid", failures}}.dump() << "\n";
    } else {
        std::cout << "Valid:   " << valid << "\n";
        std::cout << "Invalid: " << failures.size() << "\n";
        for (const auto& f : failures) {
            std::cout << "  " << f["id"].get<std::string>() << ": "
                      << f["error"].get<std::string>() << "\n";
        }
    }
    return failures.empty() ? 0 : 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "help" || command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "-v" || command == "--version") {
        std::cout << "zebra " << ZEBRA_VERSION << "\n";
        return 0;
    }

    LabelStoreConfig config = LabelStoreConfig::from_env();
    config.name = COMPONENT;

    std::string snapshot_path;
    std::vector<Query> queries;
    bool json_output = false;

    for (int i = 2; i < argc; ++i) {
        Operator op = Operator::MatchEqual;
        bool selector = false;

        if (strcmp(argv[i], "--snapshot") == 0 && i + 1 < argc) {
            snapshot_path = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--prune") == 0) {
            config.prune_empty_buckets = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            config.verbose = true;
        } else if (strcmp(argv[i], "--eq") == 0 && i + 1 < argc) {
            op = Operator::MatchEqual;
            selector = true;
        } else if (strcmp(argv[i], "--ne") == 0 && i + 1 < argc) {
            op = Operator::MatchNotEqual;
            selector = true;
        } else if (strcmp(argv[i], "--in") == 0 && i + 1 < argc) {
            op = Operator::MatchIn;
            selector = true;
        } else if (strcmp(argv[i], "--notin") == 0 && i + 1 < argc) {
            op = Operator::MatchNotIn;
            selector = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }

        if (selector) {
            Query q;
            if (!parse_selector(op, argv[++i], q)) {
                std::cerr << "Invalid selector for " << operator_name(op) << ": " << argv[i] << "\n";
                return 1;
            }
            queries.push_back(std::move(q));
        }
    }

    if (command != "stats" && command != "export" && command != "query" && command != "validate") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (snapshot_path.empty()) {
        std::cerr << "Error: --snapshot is required\n";
        return 1;
    }

    if (config.verbose) log::set_verbose(true);

    // The CLI has no type definitions of its own; decode every tag generically
    ResourceFactory factory = ResourceFactory::with_defaults();
    factory.set_fallback([] { return std::make_shared<BaseResource>(); });
    ResourceMap snapshot;
    std::string error;
    if (!read_snapshot(snapshot_path, factory, snapshot, error)) {
        log_error(COMPONENT, "%s", error.c_str());
        return 1;
    }
    log_debug(COMPONENT, "read %zu resources from %s", snapshot.total(), snapshot_path.c_str());

    if (command == "validate") {
        return cmd_validate(snapshot, json_output);
    }

    LabelStore store(snapshot, config);

    if (command == "stats") return cmd_stats(store, json_output);
    if (command == "export") return cmd_export(store, json_output);
    return cmd_query(store, queries, json_output);
}
