#include <spdlog/fmt/fmt.h>
#include <mediarepo/metadata/query_helpers.h>

namespace mediarepo::metadata::sql {

std::string join(const std::vector<std::string>& items, std::string_view separator) {
    return fmt::format("{}", fmt::join(items, separator));
}

std::string buildSelect(const QuerySpec& spec) {
    std::string sql = fmt::format("SELECT {}{} FROM {}", spec.distinct ? "DISTINCT " : "",
                                  spec.columns.empty() ? std::string("*") : join(spec.columns, ", "),
                                  spec.from);
    if (!spec.conditions.empty()) {
        sql += " WHERE " + join(spec.conditions, " AND ");
    }
    if (spec.orderBy && !spec.orderBy->empty()) {
        sql += " ORDER BY " + *spec.orderBy;
    }
    return sql;
}

std::string placeholders(size_t n) {
    if (n == 0) {
        return {};
    }
    std::string out = "?";
    out.reserve(n * 3);
    for (size_t i = 1; i < n; ++i) {
        out += ", ?";
    }
    return out;
}

} // namespace mediarepo::metadata::sql
