/// @file src/core/data_loader.cpp
/// @brief DataLoader: JSON (jsoncpp) and header-driven CSV record parsing.

#include "fras/data_loader.hpp"

#include <fmt/format.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>

namespace fras::core {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ─── JSON ─────────────────────────────────────────────────────────────────────

/// Text of a scalar JSON value. `nullopt` for null or absent members.
std::optional<std::string> scalar_text(const Json::Value& v) {
    if (v.isNull())   return std::nullopt;
    if (v.isString()) return v.asString();
    if (v.isBool())   return std::string(v.asBool() ? "true" : "false");
    if (v.isInt64())  return fmt::format("{}", v.asInt64());
    if (v.isUInt64()) return fmt::format("{}", v.asUInt64());
    // Shortest representation that reads back to the same double.
    if (v.isDouble()) return fmt::format("{}", v.asDouble());
    return std::string(v.isArray() ? "[array]" : "{object}");
}

RawRecord record_from_json(const Json::Value& obj) {
    RawRecord r;
    if (!obj.isObject()) return r;

    r.id          = scalar_text(obj["id"]).value_or("");
    r.amount      = scalar_text(obj["amount"]);
    r.timestamp   = scalar_text(obj.isMember("timestamp") ? obj["timestamp"] : obj["date"]);
    r.account     = scalar_text(obj["account"]).value_or("");
    r.vendor      = scalar_text(obj["vendor"]).value_or("");
    r.description = scalar_text(obj["description"]).value_or("");
    r.label       = scalar_text(obj["label"]);
    return r;
}

// ─── CSV ──────────────────────────────────────────────────────────────────────

/// Column positions resolved from the header row.
struct Columns {
    std::optional<std::size_t> id, amount, timestamp, account, vendor, description, label;
};

std::optional<std::string> cell(const std::vector<std::string>& fields,
                                std::optional<std::size_t> col) {
    if (!col || *col >= fields.size()) return std::nullopt;
    return fields[*col];
}

}  // anonymous namespace

// ─── DataLoader::split_csv_line ───────────────────────────────────────────────

std::vector<std::string> DataLoader::split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(trim(current));
    return fields;
}

// ─── DataLoader::parse_csv_string ─────────────────────────────────────────────

std::optional<std::vector<RawRecord>>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<Columns> cols;
    std::vector<RawRecord> records;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Skip blank lines and comment lines.
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }

        const auto fields = split_csv_line(line);

        if (!cols) {
            Columns c;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                const auto name = lower(fields[i]);
                if (name == "id" || name == "transaction_id")      c.id = i;
                else if (name == "amount")                         c.amount = i;
                else if (name == "timestamp" || name == "date")    c.timestamp = i;
                else if (name == "account")                        c.account = i;
                else if (name == "vendor")                         c.vendor = i;
                else if (name == "description")                    c.description = i;
                else if (name == "label")                          c.label = i;
            }
            if (!c.id || !c.amount || !c.timestamp) {
                return std::nullopt;
            }
            cols = c;
            continue;
        }

        RawRecord r;
        r.id          = cell(fields, cols->id).value_or("");
        r.amount      = cell(fields, cols->amount);
        r.timestamp   = cell(fields, cols->timestamp);
        r.account     = cell(fields, cols->account).value_or("");
        r.vendor      = cell(fields, cols->vendor).value_or("");
        r.description = cell(fields, cols->description).value_or("");
        r.label       = cell(fields, cols->label);

        // Empty cells count as absent.
        if (r.amount && r.amount->empty()) r.amount.reset();
        if (r.timestamp && r.timestamp->empty()) r.timestamp.reset();
        if (r.label && r.label->empty()) r.label.reset();

        records.push_back(std::move(r));
    }

    if (!cols) {
        return std::nullopt;
    }
    return records;
}

// ─── DataLoader::parse_json_string ────────────────────────────────────────────

std::optional<std::vector<RawRecord>>
DataLoader::parse_json_string(std::string_view json) noexcept {
    if (json.empty()) {
        return std::nullopt;
    }

    try {
        Json::CharReaderBuilder rb;
        const std::unique_ptr<Json::CharReader> reader(rb.newCharReader());
        Json::Value root;
        std::string errors;
        if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
            return std::nullopt;
        }

        const Json::Value* items = nullptr;
        if (root.isArray()) {
            items = &root;
        } else if (root.isObject() && root["transactions"].isArray()) {
            items = &root["transactions"];
        } else {
            return std::nullopt;
        }

        std::vector<RawRecord> records;
        records.reserve(items->size());
        for (const auto& item : *items) {
            records.push_back(record_from_json(item));
        }
        return records;
    } catch (const Json::Exception&) {
        return std::nullopt;
    }
}

// ─── DataLoader::load_file ────────────────────────────────────────────────────

std::optional<std::vector<RawRecord>>
DataLoader::load_file(const std::string& filepath) noexcept {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();

    const auto dot = filepath.find_last_of('.');
    const bool is_csv = dot != std::string::npos && lower(filepath.substr(dot)) == ".csv";

    if (is_csv) {
        return parse_csv_string(contents.str());
    }
    return parse_json_string(contents.str());
}

}  // namespace fras::core
