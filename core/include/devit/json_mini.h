#pragma once

// json_mini.h
//
// Small helpers over json-c: an owning handle plus typed member lookups
// that work directly on json_object*. Every JSON surface in devit (wire
// messages, config, manifests, tool output) goes through these.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devit::json_mini {

// Compact output without "\/" escaping.
constexpr int kDumpFlags = JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE;

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

    // Hand the reference to a json-c container (json_object_object_add etc.).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Parse one complete JSON document. A null Doc means a syntax error,
// including anything but whitespace after the first value.
// Note: the literal `null` also yields a null Doc.
inline Doc parse(const std::string& json) {
    if (json.size() >= static_cast<size_t>(INT_MAX)) return Doc{};
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    // Length includes the NUL so a trailing top-level number terminates.
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), static_cast<int>(json.size() + 1));
    json_tokener_error jerr = json_tokener_get_error(tok);
    const size_t end = static_cast<size_t>(tok->char_offset);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = std::min(end, json.size()); i < json.size(); i++) {
        const char c = json[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline bool is_object(json_object* v) {
    return v && json_object_is_type(v, json_type_object);
}

inline bool has_member(json_object* obj, const char* key) {
    if (!is_object(obj)) return false;
    return json_object_object_get_ex(obj, key, nullptr) != 0;
}

// Borrowed pointer to obj[key]; nullptr when absent or JSON null.
inline json_object* member(json_object* obj, const char* key) {
    if (!is_object(obj)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<double> get_double(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// String elements of obj[key]; non-strings are skipped.
inline std::vector<std::string> get_array_strings(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.data(), static_cast<int>(s.size()));
}

// Extra reference for embedding a borrowed value into another tree.
inline json_object* share(json_object* v) {
    return v ? json_object_get(v) : nullptr;
}

inline std::string dump(json_object* v) {
    if (!v) return "null";
    return std::string(json_object_to_json_string_ext(v, kDumpFlags));
}

inline std::string dump_pretty(json_object* v) {
    if (!v) return "null";
    return std::string(json_object_to_json_string_ext(
        v, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE));
}

inline std::vector<std::string> string_array_values(json_object* arr) {
    std::vector<std::string> out;
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) out.emplace_back(json_object_get_string(el));
    }
    return out;
}

inline json_object* new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, new_string(s));
    return arr;
}

} // namespace devit::json_mini
