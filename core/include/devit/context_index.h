#pragma once

#include <json-c/json.h>

#include <filesystem>
#include <string>
#include <vector>

namespace devit {

constexpr const char* kDefaultIndexPath = ".devit/index.json";
constexpr int kContextHeadDefaultLimit = 50;
constexpr int kContextHeadMaxLimit = 1000;

struct ContextHeadQuery {
    std::filesystem::path index_path{kDefaultIndexPath};
    std::vector<std::string> exts;  // normalized without leading dot; empty = all
    int limit{kContextHeadDefaultLimit};
};

// From tool args {limit?, ext?: [..] | "a,b", index?}. args may be nullptr.
ContextHeadQuery context_head_query(json_object* args, const std::filesystem::path& default_index);

// Top files of a previously generated index, by score descending. Never
// fails: a missing, unparsable or malformed index yields {ok:false, ...}.
// Returns a new reference.
json_object* context_head(const ContextHeadQuery& q);

} // namespace devit
