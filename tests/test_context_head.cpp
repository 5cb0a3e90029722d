#include "test_common.h"

#include "devit/context_index.h"
#include "devit/json_mini.h"

#include <vector>

using namespace devit;

static std::vector<std::string> paths_of(json_object* res) {
    std::vector<std::string> out;
    json_object* files = json_mini::member(res, "files");
    const size_t n = files ? json_object_array_length(files) : 0;
    for (size_t i = 0; i < n; i++) {
        out.push_back(json_mini::get_string(json_object_array_get_idx(files, i), "path").value_or("?"));
    }
    return out;
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_dir("devit_test_context_head");
    fs::path index = dir / "index.json";
    write_file(index, R"({"root":".","files":[
        {"path":"src/a.rs","size":10,"lang":"rust","score":1.5,"symbols_count":2},
        {"path":"src/b.py","size":20,"lang":"python","score":9,"symbols_count":7},
        {"path":"README.md","size":5,"lang":"markdown","score":0.1,"symbols_count":0},
        {"path":"src/c.rs","size":30,"lang":"rust","score":4.25,"symbols_count":3},
        {"path":"src/d.RS","size":1,"lang":"rust","score":4.25,"symbols_count":1}
    ]})");

    // Defaults: all files, score descending, ties keep index order.
    {
        json_mini::Doc args(json_object_new_object());
        json_object_object_add(args.root, "index", json_mini::new_string(index.string()));
        json_mini::Doc r(context_head(context_head_query(args.root, kDefaultIndexPath)));
        expect_true(json_mini::get_bool(r.root, "ok") == true, "ok");
        expect_eq_ll(json_mini::get_int(r.root, "total").value_or(-1), 5, "total");
        expect_eq_ll(json_mini::get_int(r.root, "returned").value_or(-1), 5, "returned");
        auto p = paths_of(r.root);
        expect_eq_str(p[0], "src/b.py", "highest score first");
        expect_eq_str(p[1], "src/c.rs", "tie keeps order (1)");
        expect_eq_str(p[2], "src/d.RS", "tie keeps order (2)");
        expect_eq_str(p[4], "README.md", "lowest last");
    }

    // Extension filter (array, with or without dot, case-insensitive) and limit.
    {
        json_mini::Doc args = json_mini::parse(R"({"ext":[".rs"],"limit":2})");
        json_mini::Doc r(context_head(context_head_query(args.root, index)));
        expect_eq_ll(json_mini::get_int(r.root, "total").value_or(-1), 3, "rust files matched");
        expect_eq_ll(json_mini::get_int(r.root, "returned").value_or(-1), 2, "limit applied");
        auto p = paths_of(r.root);
        expect_eq_str(p[0], "src/c.rs", "rs first");
        expect_eq_str(p[1], "src/d.RS", "rs second");
    }

    // Comma-separated extension string
    {
        json_mini::Doc args = json_mini::parse(R"({"ext":"py, md"})");
        json_mini::Doc r(context_head(context_head_query(args.root, index)));
        auto p = paths_of(r.root);
        expect_eq_ll((long long)p.size(), 2, "py + md");
        expect_eq_str(p[0], "src/b.py", "py");
        expect_eq_str(p[1], "README.md", "md");
    }

    // Limit is clamped to [1, 1000].
    {
        json_mini::Doc lo = json_mini::parse(R"({"limit":0})");
        expect_eq_ll(context_head_query(lo.root, index).limit, 1, "clamp low");
        json_mini::Doc hi = json_mini::parse(R"({"limit":5000})");
        expect_eq_ll(context_head_query(hi.root, index).limit, kContextHeadMaxLimit, "clamp high");
        expect_eq_ll(context_head_query(nullptr, index).limit, kContextHeadDefaultLimit, "default limit");
        expect_true(context_head_query(nullptr, index).index_path == index, "default index");
    }

    // Missing index
    {
        ContextHeadQuery q;
        q.index_path = dir / "nope.json";
        json_mini::Doc r(context_head(q));
        expect_true(json_mini::get_bool(r.root, "ok") == false, "missing: ok=false");
        expect_true(json_mini::get_bool(r.root, "not_indexed") == true, "not_indexed");
        const std::string hint = json_mini::get_string(r.root, "hint").value_or("");
        expect_true(hint.find("devit context map .") != std::string::npos, "hint names the command: " + hint);
    }

    // Unparsable and malformed index
    {
        write_file(dir / "broken.json", "{\"files\": [");
        ContextHeadQuery q;
        q.index_path = dir / "broken.json";
        json_mini::Doc r(context_head(q));
        expect_true(json_mini::get_bool(r.root, "parse_error") == true, "parse_error");

        write_file(dir / "nofiles.json", R"({"files":"x"})");
        q.index_path = dir / "nofiles.json";
        json_mini::Doc r2(context_head(q));
        expect_true(json_mini::get_bool(r2.root, "invalid_index") == true, "invalid_index");
        expect_true(json_mini::get_string(r2.root, "message").has_value(), "invalid_index message");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_context_head: ALL PASSED" << std::endl;
    return 0;
}
