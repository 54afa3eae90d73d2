#include "codemode/json.h"

#include <algorithm>
#include <climits>
#include <cstring>
#include <sstream>
#include <utility>

namespace codemode::json {

bool parse_value(const std::string& text, Doc* out) {
    *out = Doc{};
    if (text.size() >= (size_t)INT_MAX) return false;
    json_tokener* tok = json_tokener_new();
    if (!tok) return false;
    // The terminating NUL is passed too so a bare top-level number is
    // reported as complete instead of json_tokener_continue.
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(), (int)text.size() + 1);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = (size_t)json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    Doc d{obj};
    if (jerr != json_tokener_success) return false;
    for (size_t i = std::min(consumed, text.size()); i < text.size(); i++) {
        char c = text[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\0') return false;
    }
    *out = std::move(d);
    return true;
}

Doc parse(const std::string& text) {
    Doc d;
    if (!parse_value(text, &d)) return Doc{};
    return d;
}

std::string to_string(json_object* o) {
    if (!o) return "null";
    size_t len = 0;
    const char* s = json_object_to_json_string_length(o, JSON_C_TO_STRING_PLAIN, &len);
    return s ? std::string(s, len) : std::string("null");
}

json_object* new_raw(const std::string& json_text) {
    json_object* o = json_object_new_string("");
    if (!o) return nullptr;
    char* text = strdup(json_text.c_str());
    if (!text) {
        json_object_put(o);
        return nullptr;
    }
    json_object_set_serializer(o, json_object_userdata_to_json_string, text, json_object_free_userdata);
    return o;
}

std::string quote(const std::string& s) {
    Doc d{json_object_new_string_len(s.c_str(), (int)s.size())};
    if (!d) return "\"\"";
    return to_string(d.root);
}

namespace {

void canonical_into(json_object* obj, std::ostringstream& out) {
    if (!obj) {
        out << "null";
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());
        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_into(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_into(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << to_string(obj);
        break;
    }
}

} // namespace

std::string canonical(json_object* o) {
    std::ostringstream out;
    canonical_into(o, out);
    return out.str();
}

void put_string(json_object* obj, const char* key, const std::string& v) {
    json_object_object_add(obj, key, json_object_new_string_len(v.c_str(), (int)v.size()));
}

std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, key, &v) || !json_object_is_type(v, json_type_string))
        return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, key, &v) || !json_object_is_type(v, json_type_boolean))
        return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int) && !json_object_is_type(v, json_type_double))
        return std::nullopt;
    return json_object_get_int64(v);
}

std::optional<double> get_double(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int) && !json_object_is_type(v, json_type_double))
        return std::nullopt;
    return json_object_get_double(v);
}

std::vector<std::string> get_string_array(json_object* o, const char* key) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, key, &v) || !json_object_is_type(v, json_type_array))
        return out;
    const size_t n = json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string))
            out.emplace_back(json_object_get_string(it), (size_t)json_object_get_string_len(it));
    }
    return out;
}

} // namespace codemode::json
