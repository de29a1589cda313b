#include "io/JsonIO.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
using splitlens::Assignment;
using splitlens::Cents;
using splitlens::LineItem;
using splitlens::Session;
using splitlens::SplitConfig;

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

// Numbers are rounded to the cent; strings are parsed exactly.
static Cents require_amount(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    const json& v = j.at(key);
    const std::string field = where + "." + std::string(key);

    try {
        if (v.is_number()) return splitlens::to_cents(v.get<double>());
        if (v.is_string()) return splitlens::parse_amount(v.get<std::string>());
    } catch (const std::exception& e) {
        throw std::runtime_error(field + ": " + e.what());
    }
    throw std::runtime_error(field + " must be a number or decimal string");
}

static Assignment parseAssignment(const json& j, const std::string& where) {
    if (!j.contains("assigned_to") || j.at("assigned_to").is_null()) return Assignment::unassigned();

    const json& a = j.at("assigned_to");
    if (a.is_string()) {
        const std::string s = a.get<std::string>();
        if (s == kAllSentinel) return Assignment::everyone();
        return Assignment::subset({s});
    }

    const std::vector<std::string> ids = require_string_array(j, "assigned_to", where);
    for (const auto& id : ids) {
        if (id == kAllSentinel) return Assignment::everyone();
    }
    return Assignment::subset(ids);
}

static LineItem parseItem(const json& j, const std::string& where) {
    require_object(j, where);

    LineItem item;
    item.name = require_string(j, "name", where);

    if (j.contains("quantity")) {
        if (!j.at("quantity").is_number_integer()) {
            throw std::runtime_error(where + ".quantity must be an integer");
        }
        const json& q = j.at("quantity");
        const bool in_range = q.is_number_unsigned()
            ? q.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : (q.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
               q.get<std::int64_t>() <= std::numeric_limits<int>::max());
        if (!in_range) throw std::runtime_error(where + ".quantity out of range");
        item.quantity = static_cast<int>(q.get<std::int64_t>());
    }

    item.amount = require_amount(j, "price", where);
    item.assignment = parseAssignment(j, where);
    return item;
}

Session parseSession(const json& j) {
    require_object(j, "root");

    Session s;
    s.participants = require_string_array(j, "participants", "root");
    s.payer = require_string(j, "paid_by", "root");
    s.entered_total = require_amount(j, "total_amount", "root");

    if (!j.contains("items")) {
        throw std::runtime_error("root missing required field: items");
    }
    const json& items = j.at("items");
    require_array(items, "root.items");

    for (size_t i = 0; i < items.size(); ++i) {
        std::ostringstream oss;
        oss << "root.items[" << i << "]";
        s.items.push_back(parseItem(items.at(i), oss.str()));
    }

    return s;
}

Session loadSession(const std::string& path) {
    return parseSession(read_json_file(path, "session"));
}

static double get_double_or(const json& j, const char* key, double def, const std::string& where) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_number()) throw std::runtime_error(where + "." + std::string(key) + " must be a number");
    return j.at(key).get<double>();
}

SplitConfig parseSplitConfig(const json& root, SplitConfig base) {
    require_object(root, "config");

    const bool nested = root.contains("split_config");
    const json& j = nested ? root.at("split_config") : root;
    const std::string where = nested ? "config.split_config" : "config";
    require_object(j, where);

    base.variance_warning_percent = get_double_or(j, "variance_warning_percent", base.variance_warning_percent, where);
    base.variance_error_percent = get_double_or(j, "variance_error_percent", base.variance_error_percent, where);

    if (j.contains("min_settlement")) base.min_settlement_cents = require_amount(j, "min_settlement", where);
    if (j.contains("discrepancy_tolerance")) base.discrepancy_tolerance_cents = require_amount(j, "discrepancy_tolerance", where);

    if (j.contains("min_participants")) {
        if (!j.at("min_participants").is_number_integer()) {
            throw std::runtime_error(where + ".min_participants must be an integer");
        }
        base.min_participants = j.at("min_participants").get<int>();
    }

    if (base.variance_warning_percent < 0.0 || base.variance_error_percent < base.variance_warning_percent) {
        throw std::runtime_error(where + ": need 0 <= variance_warning_percent <= variance_error_percent");
    }

    return base;
}

SplitConfig loadSplitConfig(const std::string& path, SplitConfig base) {
    return parseSplitConfig(read_json_file(path, "config"), base);
}
