#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediarepo::metadata::sql {

struct QuerySpec {
    bool distinct = false;
    std::vector<std::string> columns; // empty => "*"
    std::string from;                 // Table or join expression
    std::vector<std::string> conditions;
    std::optional<std::string> orderBy;
};

// SELECT with the conditions joined by AND
std::string buildSelect(const QuerySpec& spec);

// "?, ?, ?" for an IN (...) list of n parameters
std::string placeholders(size_t n);

std::string join(const std::vector<std::string>& items, std::string_view separator);

} // namespace mediarepo::metadata::sql
