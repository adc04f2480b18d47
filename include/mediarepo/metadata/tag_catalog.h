#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/models.h>

namespace mediarepo::metadata {

/**
 * @brief A tag string split into its optional namespace and name, both normalized
 */
struct ParsedTag {
    std::optional<std::string> ns;
    std::string name;

    bool operator==(const ParsedTag&) const = default;
};

/**
 * @brief Trim surrounding whitespace and lowercase
 */
std::string normalizeTagName(std::string_view raw);

/**
 * @brief Parse "namespace:name" or "name"
 *
 * Splits on the first ':' so names may contain colons ("time:12:30"). An empty namespace part
 * (":name") means no namespace.
 */
ParsedTag parseTag(std::string_view raw);

std::string formatTag(const ParsedTag& tag);

/**
 * @brief Namespace and tag catalog with idempotent find-or-create
 */
class TagCatalog {
public:
    explicit TagCatalog(std::shared_ptr<ConnectionPool> pool);

    Result<NamespaceInfo> findOrCreateNamespace(const std::string& name);
    Result<TagInfo> findOrCreateTag(const std::optional<std::string>& ns, const std::string& name);
    Result<TagInfo> findOrCreateTag(std::string_view raw);

    /**
     * @brief Find or create every tag of the list in one write transaction
     *
     * Duplicates in the input are collapsed; the result holds one entry per distinct tag, in
     * first-seen order. Safe to call concurrently with overlapping lists.
     */
    Result<std::vector<TagInfo>> addAll(const std::vector<ParsedTag>& tags);

    Result<std::optional<NamespaceInfo>> namespaceByName(const std::string& name);
    Result<std::vector<NamespaceInfo>> allNamespaces();

    Result<std::optional<TagInfo>> tagById(int64_t id);
    Result<std::optional<TagInfo>> findTag(const ParsedTag& tag);

    /**
     * @brief Existing tags among raw tag strings; unknown ones are skipped
     */
    Result<std::vector<TagInfo>> tagsByNames(const std::vector<std::string>& rawTags);

    Result<std::vector<TagInfo>> allTags();
    Result<std::vector<TagInfo>> tagsForFile(int64_t fileId);
    Result<std::vector<TagInfo>> tagsForFiles(const std::vector<int64_t>& fileIds);
    Result<std::vector<TagInfo>> tagsForHashes(const std::vector<Hash>& hashes);

    Result<void> addTagsToFile(int64_t fileId, const std::vector<int64_t>& tagIds);

    /**
     * @brief Link addIds and unlink removeIds, then return the file's tags
     */
    Result<std::vector<TagInfo>> changeFileTags(int64_t fileId, const std::vector<int64_t>& addIds,
                                                const std::vector<int64_t>& removeIds);

private:
    std::shared_ptr<ConnectionPool> pool_;

    Result<std::vector<TagInfo>> queryTags(const std::string& whereClause,
                                           const std::vector<int64_t>& ids);
};

} // namespace mediarepo::metadata
