#pragma once

// json-c helpers shared by the worker protocol, the audit log and the tool
// response encoder.

#include <json-c/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codemode::json {

// Owning handle for a json_object tree.
struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Gives up ownership, e.g. to json_object_object_add.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or truncated input fails. A JSON null
// parses successfully into an empty Doc.
bool parse_value(const std::string& text, Doc* out);

// parse_value for callers that expect an object or array; empty on failure.
Doc parse(const std::string& text);

inline Doc new_object() { return Doc{json_object_new_object()}; }

std::string to_string(json_object* o);

// A node that serializes as json_text verbatim, whatever its nesting depth.
// json_text must already be valid JSON (e.g. JSON.stringify output).
json_object* new_raw(const std::string& json_text);
std::string quote(const std::string& s);

// Sorted-key serialization, used for hash chaining.
std::string canonical(json_object* o);

// Adds a string value, preserving embedded NULs and length.
void put_string(json_object* obj, const char* key, const std::string& v);

std::optional<std::string> get_string(json_object* o, const char* key);
std::optional<bool> get_bool(json_object* o, const char* key);
std::optional<int64_t> get_int(json_object* o, const char* key);
std::optional<double> get_double(json_object* o, const char* key);
std::vector<std::string> get_string_array(json_object* o, const char* key);

} // namespace codemode::json
