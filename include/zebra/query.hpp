#pragma once
// Label queries: operator + key + candidate values
//
//   MatchEqual     key == v          (exactly one value)
//   MatchNotEqual  key != v          (exactly one value)
//   MatchIn        key in (v1, ...)
//   MatchNotIn     key notin (v1, ...)
//
// Resources that do not carry the key never match, for any operator.

#include "status.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zebra {

using json = nlohmann::json;

// Numeric values are the wire codes
enum class Operator : uint8_t {
    MatchEqual = 0,
    MatchNotEqual = 1,
    MatchIn = 2,
    MatchNotIn = 3
};

inline const char* operator_name(Operator op) {
    switch (op) {
        case Operator::MatchEqual: return "MatchEqual";
        case Operator::MatchNotEqual: return "MatchNotEqual";
        case Operator::MatchIn: return "MatchIn";
        case Operator::MatchNotIn: return "MatchNotIn";
    }
    return "unknown";
}

inline const char* operator_symbol(Operator op) {
    switch (op) {
        case Operator::MatchEqual: return "==";
        case Operator::MatchNotEqual: return "!=";
        case Operator::MatchIn: return "in";
        case Operator::MatchNotIn: return "notin";
    }
    return "?";
}

inline std::optional<Operator> parse_operator(const std::string& s) {
    if (s == "MatchEqual" || s == "==" || s == "=" || s == "0") return Operator::MatchEqual;
    if (s == "MatchNotEqual" || s == "!=" || s == "1") return Operator::MatchNotEqual;
    if (s == "MatchIn" || s == "in" || s == "2") return Operator::MatchIn;
    if (s == "MatchNotIn" || s == "notin" || s == "3") return Operator::MatchNotIn;
    return std::nullopt;
}

struct Query {
    Operator op = Operator::MatchEqual;
    std::string key;
    std::vector<std::string> values;

    static Query equal(std::string key, std::string value) {
        return {Operator::MatchEqual, std::move(key), {std::move(value)}};
    }

    static Query not_equal(std::string key, std::string value) {
        return {Operator::MatchNotEqual, std::move(key), {std::move(value)}};
    }

    static Query in(std::string key, std::vector<std::string> values) {
        return {Operator::MatchIn, std::move(key), std::move(values)};
    }

    static Query not_in(std::string key, std::vector<std::string> values) {
        return {Operator::MatchNotIn, std::move(key), std::move(values)};
    }

    // Whether the operator/value-count combination can be evaluated at all.
    // The index accepts any well-formed query; validate() is stricter.
    bool well_formed() const {
        switch (op) {
            case Operator::MatchEqual:
            case Operator::MatchNotEqual:
                return values.size() == 1;
            case Operator::MatchIn:
            case Operator::MatchNotIn:
                return true;
        }
        return false;
    }

    // Request-level validation: also rejects empty keys and empty value sets
    Status validate() const {
        switch (op) {
            case Operator::MatchEqual:
            case Operator::MatchNotEqual:
                if (values.size() != 1) {
                    return Status::fail(Errc::InvalidQuery,
                        std::string(operator_name(op)) + " requires exactly one value, got " +
                        std::to_string(values.size()));
                }
                break;
            case Operator::MatchIn:
            case Operator::MatchNotIn:
                if (values.empty()) {
                    return Status::fail(Errc::InvalidQuery,
                        std::string(operator_name(op)) + " requires at least one value");
                }
                break;
            default:
                return Status::fail(Errc::InvalidQuery,
                    "unknown operator " + std::to_string(static_cast<int>(op)));
        }
        if (key.empty()) {
            return Status::fail(Errc::InvalidQuery, "query key is empty");
        }
        return Status::ok();
    }

    // Whether a single label value satisfies the operator
    bool accepts(const std::string& value) const {
        bool listed = std::find(values.begin(), values.end(), value) != values.end();
        switch (op) {
            case Operator::MatchEqual:
            case Operator::MatchIn:
                return listed;
            case Operator::MatchNotEqual:
            case Operator::MatchNotIn:
                return !listed;
        }
        return false;
    }

    // "rack in (7, 8)"
    std::string to_string() const {
        std::string out = key + " " + operator_symbol(op) + " ";
        if (op == Operator::MatchEqual || op == Operator::MatchNotEqual) {
            return out + (values.empty() ? "" : values.front());
        }
        out += "(";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out += ", ";
            out += values[i];
        }
        return out + ")";
    }

    json to_json() const {
        return {
            {"op", operator_name(op)},
            {"key", key},
            {"values", values}
        };
    }

    // {"op": "MatchIn" | "in" | 2, "key": "rack", "values": ["7", "8"]}
    static Status from_json(const json& j, Query& out) {
        if (!j.is_object()) {
            return Status::fail(Errc::InvalidQuery, "query is not an object");
        }

        try {
            const json& op = j.at("op");
            std::optional<Operator> parsed;
            if (op.is_number_unsigned()) {
                uint64_t code = op.get<uint64_t>();
                if (code <= 3) parsed = parse_operator(std::to_string(code));
            } else if (op.is_number_integer()) {
                int64_t code = op.get<int64_t>();
                if (code >= 0 && code <= 3) parsed = parse_operator(std::to_string(code));
            } else if (op.is_string()) {
                parsed = parse_operator(op.get<std::string>());
            }
            if (!parsed) {
                return Status::fail(Errc::InvalidQuery, "unknown operator " + op.dump());
            }

            out.op = *parsed;
            out.key = j.value("key", std::string());
            out.values.clear();
            if (j.contains("values") && !j["values"].is_null()) {
                out.values = j["values"].get<std::vector<std::string>>();
            }
        } catch (const json::exception& e) {
            return Status::fail(Errc::InvalidQuery, std::string("malformed query: ") + e.what());
        }
        return Status::ok();
    }
};

} // namespace zebra
