#include "devit/context_index.h"
#include "devit/json_mini.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace devit {

static std::string normalize_ext(std::string e) {
    while (!e.empty() && (e.front() == '.' || std::isspace((unsigned char)e.front()))) e.erase(e.begin());
    while (!e.empty() && std::isspace((unsigned char)e.back())) e.pop_back();
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c) { return std::tolower(c); });
    return e;
}

static json_object* failure(const char* flag, const std::string& key, const std::string& text) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(0));
    json_object_object_add(o, flag, json_object_new_boolean(1));
    json_object_object_add(o, key.c_str(), json_mini::new_string(text));
    return o;
}

ContextHeadQuery context_head_query(json_object* args, const std::filesystem::path& default_index) {
    ContextHeadQuery q;
    q.index_path = default_index;

    if (auto idx = json_mini::get_string(args, "index")) {
        if (!idx->empty()) q.index_path = *idx;
    }

    if (auto lim = json_mini::get_int(args, "limit")) {
        int64_t v = *lim;
        if (v < 1) v = 1;
        if (v > kContextHeadMaxLimit) v = kContextHeadMaxLimit;
        q.limit = static_cast<int>(v);
    }

    json_object* ext = json_mini::member(args, "ext");
    std::vector<std::string> raw;
    if (ext && json_object_is_type(ext, json_type_array)) {
        raw = json_mini::string_array_values(ext);
    } else if (ext && json_object_is_type(ext, json_type_string)) {
        std::stringstream ss(json_object_get_string(ext));
        std::string part;
        while (std::getline(ss, part, ',')) raw.push_back(part);
    }
    for (auto& e : raw) {
        std::string n = normalize_ext(e);
        if (!n.empty()) q.exts.push_back(n);
    }
    return q;
}

json_object* context_head(const ContextHeadQuery& q) {
    std::ifstream f(q.index_path);
    if (!f) {
        return failure("not_indexed", "hint",
                       "run `devit context map .` to build " + q.index_path.string());
    }
    std::stringstream ss;
    ss << f.rdbuf();

    json_mini::Doc d = json_mini::parse(ss.str());
    if (!d) {
        return failure("parse_error", "message", "invalid JSON in " + q.index_path.string());
    }
    json_object* files = json_mini::member(d.root, "files");
    if (!files || !json_object_is_type(files, json_type_array)) {
        return failure("invalid_index", "message", "index has no files[] array");
    }

    struct Entry {
        double score;
        json_object* obj;
    };
    std::vector<Entry> picked;
    const size_t n = json_object_array_length(files);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(files, i);
        if (!json_mini::is_object(el)) continue;
        auto path = json_mini::get_string(el, "path");
        if (!path) continue;
        if (!q.exts.empty()) {
            std::string ext = normalize_ext(std::filesystem::path(*path).extension().string());
            if (std::find(q.exts.begin(), q.exts.end(), ext) == q.exts.end()) continue;
        }
        picked.push_back(Entry{json_mini::get_double(el, "score").value_or(0.0), el});
    }

    std::stable_sort(picked.begin(), picked.end(),
                     [](const Entry& a, const Entry& b) { return a.score > b.score; });

    const size_t take = std::min(picked.size(), static_cast<size_t>(q.limit));
    json_object* out_files = json_object_new_array();
    for (size_t i = 0; i < take; i++) {
        json_object_array_add(out_files, json_mini::share(picked[i].obj));
    }

    json_object* out = json_object_new_object();
    json_object_object_add(out, "ok", json_object_new_boolean(1));
    json_object_object_add(out, "index", json_mini::new_string(q.index_path.string()));
    json_object_object_add(out, "total", json_object_new_int64(static_cast<int64_t>(picked.size())));
    json_object_object_add(out, "returned", json_object_new_int64(static_cast<int64_t>(take)));
    json_object_object_add(out, "files", out_files);
    return out;
}

} // namespace devit
