#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/models.h>
#include <mediarepo/metadata/tag_catalog.h>

namespace mediarepo::search {

/**
 * @brief One predicate of a tag query: the file must (or, negated, must not) carry the tag
 */
struct TagQuery {
    std::string tag;
    bool negate = false;
};

enum class SortDirection { Ascending, Descending };

struct SortKey {
    enum class Kind {
        FileName,
        FileSize,
        FileImportedTime,
        FileCreatedTime,
        FileChangeTime,
        FileType,
        NumTags,
        Namespace
    };

    Kind kind = Kind::FileImportedTime;
    SortDirection direction = SortDirection::Ascending;
    std::string ns; ///< Namespace name, only for Kind::Namespace

    static SortKey byNamespace(std::string name,
                               SortDirection direction = SortDirection::Ascending) {
        return SortKey{Kind::Namespace, direction, std::move(name)};
    }
};

/**
 * @brief Per-file data the sort keys need beyond FileInfo
 */
struct SortContext {
    std::map<int64_t, size_t> tagCounts;
    // namespace -> file id -> tag names in that namespace (sorted)
    std::map<std::string, std::map<int64_t, std::vector<std::string>>> namespaceValues;
};

/**
 * @brief Compare two namespace tag values, numerically when both parse as numbers
 */
int compareTagValues(const std::string& a, const std::string& b);

/**
 * @brief Stable multi-key sort; final tie break is file id
 *
 * A file without a tag in a Namespace key's namespace sorts after the files that have one,
 * in either direction.
 */
void sortFiles(std::vector<metadata::FileInfo>& files, const std::vector<SortKey>& keys,
               const SortContext& context);

/**
 * @brief Boolean tag query evaluation over the catalog
 */
class QueryEngine {
public:
    QueryEngine(std::shared_ptr<metadata::ConnectionPool> pool,
                std::shared_ptr<metadata::TagCatalog> catalog);

    /**
     * @brief Files carrying every non-negated tag and none of the negated ones
     *
     * A non-negated tag that does not exist matches nothing; a negated one is ignored. An
     * empty predicate list matches every file. Results are ordered by file id.
     */
    Result<std::vector<metadata::FileInfo>> findFiles(const std::vector<TagQuery>& predicates);

    Result<std::vector<metadata::FileInfo>> findFiles(const std::vector<TagQuery>& predicates,
                                                      const std::vector<SortKey>& sortKeys);

    /**
     * @brief Load what sortKeys need and sort files in place
     */
    Result<void> sort(std::vector<metadata::FileInfo>& files, const std::vector<SortKey>& sortKeys);

private:
    std::shared_ptr<metadata::ConnectionPool> pool_;
    std::shared_ptr<metadata::TagCatalog> catalog_;

    Result<SortContext> loadSortContext(const std::vector<SortKey>& sortKeys);
};

} // namespace mediarepo::search
