#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <mediarepo/metadata/find_or_create.h>
#include <mediarepo/metadata/query_helpers.h>
#include <mediarepo/metadata/tag_catalog.h>

namespace mediarepo::metadata {

namespace {

constexpr std::string_view TAG_COLUMNS = "t.id, t.namespace_id, n.name, t.name";
constexpr std::string_view TAG_FROM = "tags t LEFT JOIN namespaces n ON n.id = t.namespace_id";

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

Result<std::vector<TagInfo>> collectTags(Statement& stmt) {
    std::vector<TagInfo> tags;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        tags.push_back(UniqueKeyTraits<TagInfo>::extract(stmt));
    }
    return tags;
}

Result<void> bindIds(Statement& stmt, const std::vector<int64_t>& ids, int startIndex = 1) {
    for (size_t i = 0; i < ids.size(); ++i) {
        auto bindResult = stmt.bind(startIndex + static_cast<int>(i), ids[i]);
        if (!bindResult)
            return bindResult;
    }
    return {};
}

std::vector<int64_t> distinctIds(const std::vector<int64_t>& ids) {
    std::set<int64_t> seen(ids.begin(), ids.end());
    return {seen.begin(), seen.end()};
}

// Normalizes again so hand-built ParsedTags behave like parsed ones
ParsedTag normalized(const ParsedTag& tag) {
    ParsedTag out;
    out.name = normalizeTagName(tag.name);
    if (tag.ns) {
        auto ns = normalizeTagName(*tag.ns);
        if (!ns.empty()) {
            out.ns = std::move(ns);
        }
    }
    return out;
}

Result<void> requireFile(Database& db, int64_t fileId) {
    auto stmtResult = db.prepare("SELECT 1 FROM files WHERE id = ?");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = stmt.bind(1, fileId);
    if (!bindResult)
        return bindResult;

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (!stepResult.value()) {
        return Error{ErrorCode::NotFound, fmt::format("File {} not found", fileId)};
    }
    return {};
}

Result<void> requireTags(Database& db, const std::vector<int64_t>& tagIds) {
    if (tagIds.empty()) {
        return {};
    }
    auto stmtResult = db.prepare("SELECT COUNT(*) FROM tags WHERE id IN (" +
                                 sql::placeholders(tagIds.size()) + ")");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto bindResult = bindIds(stmt, tagIds);
    if (!bindResult)
        return bindResult;

    auto stepResult = stmt.step();
    if (!stepResult)
        return stepResult.error();
    if (stmt.getInt64(0) != static_cast<int64_t>(tagIds.size())) {
        return Error{ErrorCode::NotFound, "One or more tags do not exist"};
    }
    return {};
}

Result<void> linkTags(Database& db, int64_t fileId, const std::vector<int64_t>& tagIds) {
    auto stmtResult =
        db.prepare("INSERT INTO file_tags (file_id, tag_id) VALUES (?, ?) ON CONFLICT DO NOTHING");
    if (!stmtResult)
        return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    for (auto tagId : tagIds) {
        MEDIAREPO_TRY(stmt.reset());
        MEDIAREPO_TRY(stmt.bindAll(fileId, tagId));
        MEDIAREPO_TRY(stmt.execute());
    }
    return {};
}

} // namespace

std::string normalizeTagName(std::string_view raw) {
    auto trimmed = trimView(raw);
    std::string out(trimmed);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

ParsedTag parseTag(std::string_view raw) {
    ParsedTag tag;
    auto colon = raw.find(':');
    if (colon == std::string_view::npos) {
        tag.name = normalizeTagName(raw);
        return tag;
    }

    auto ns = normalizeTagName(raw.substr(0, colon));
    if (!ns.empty()) {
        tag.ns = std::move(ns);
    }
    tag.name = normalizeTagName(raw.substr(colon + 1));
    return tag;
}

std::string formatTag(const ParsedTag& tag) {
    if (tag.ns) {
        return *tag.ns + ":" + tag.name;
    }
    return tag.name;
}

TagCatalog::TagCatalog(std::shared_ptr<ConnectionPool> pool) : pool_(std::move(pool)) {}

Result<NamespaceInfo> TagCatalog::findOrCreateNamespace(const std::string& name) {
    auto normalizedName = normalizeTagName(name);
    if (normalizedName.empty()) {
        return Error{ErrorCode::InvalidArgument, "Namespace name must not be empty"};
    }
    return pool_->withConnection([&](Database& db) -> Result<NamespaceInfo> {
        return findOrCreate<NamespaceInfo>(db, normalizedName);
    });
}

Result<TagInfo> TagCatalog::findOrCreateTag(const std::optional<std::string>& ns,
                                            const std::string& name) {
    auto tag = normalized(ParsedTag{ns, name});
    if (tag.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Tag name must not be empty"};
    }

    return pool_->withConnection([&](Database& db) -> Result<TagInfo> {
        std::optional<int64_t> namespaceId;
        if (tag.ns) {
            MEDIAREPO_TRY_UNWRAP(nsInfo, findOrCreate<NamespaceInfo>(db, *tag.ns));
            namespaceId = nsInfo.id;
        }
        return findOrCreate<TagInfo>(db, TagKey{namespaceId, tag.name});
    });
}

Result<TagInfo> TagCatalog::findOrCreateTag(std::string_view raw) {
    auto tag = parseTag(raw);
    return findOrCreateTag(tag.ns, tag.name);
}

Result<std::vector<TagInfo>> TagCatalog::addAll(const std::vector<ParsedTag>& tags) {
    std::vector<ParsedTag> unique;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& raw : tags) {
        auto tag = normalized(raw);
        if (tag.name.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Empty tag name in '{}'", formatTag(raw))};
        }
        if (seen.emplace(tag.ns.value_or(""), tag.name).second) {
            unique.push_back(std::move(tag));
        }
    }

    if (unique.empty()) {
        return std::vector<TagInfo>{};
    }

    std::vector<TagInfo> result;
    auto txResult = pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction(
            [&]() -> Result<void> {
                std::vector<std::string> nsNames;
                std::set<std::string> nsSeen;
                for (const auto& tag : unique) {
                    if (tag.ns && nsSeen.insert(*tag.ns).second) {
                        nsNames.push_back(*tag.ns);
                    }
                }

                MEDIAREPO_TRY_UNWRAP(namespaces, findOrCreateAll<NamespaceInfo>(db, nsNames));
                std::map<std::string, int64_t> nsIds;
                for (const auto& ns : namespaces) {
                    nsIds[ns.name] = ns.id;
                }

                std::vector<TagKey> keys;
                keys.reserve(unique.size());
                for (const auto& tag : unique) {
                    std::optional<int64_t> nsId;
                    if (tag.ns) {
                        nsId = nsIds.at(*tag.ns);
                    }
                    keys.push_back(TagKey{nsId, tag.name});
                }

                MEDIAREPO_TRY_UNWRAP(created, findOrCreateAll<TagInfo>(db, keys));
                result = std::move(created);
                return {};
            },
            TransactionMode::Immediate);
    });
    if (!txResult) {
        spdlog::error("Failed to add {} tags: {}", unique.size(), txResult.error().message);
        return txResult.error();
    }

    spdlog::debug("Resolved {} tags", result.size());
    return result;
}

Result<std::optional<NamespaceInfo>> TagCatalog::namespaceByName(const std::string& name) {
    auto normalizedName = normalizeTagName(name);
    return pool_->withConnection([&](Database& db) -> Result<std::optional<NamespaceInfo>> {
        return findByKey<NamespaceInfo>(db, normalizedName);
    });
}

Result<std::vector<NamespaceInfo>> TagCatalog::allNamespaces() {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<NamespaceInfo>> {
        auto stmtResult = db.prepare("SELECT id, name FROM namespaces ORDER BY name");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        std::vector<NamespaceInfo> namespaces;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            namespaces.push_back(UniqueKeyTraits<NamespaceInfo>::extract(stmt));
        }
        return namespaces;
    });
}

Result<std::vector<TagInfo>> TagCatalog::queryTags(const std::string& whereClause,
                                                   const std::vector<int64_t>& ids) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<TagInfo>> {
        sql::QuerySpec spec;
        spec.distinct = true;
        spec.columns = {std::string(TAG_COLUMNS)};
        spec.from = std::string(TAG_FROM);
        if (!whereClause.empty()) {
            spec.conditions.push_back(whereClause);
        }
        spec.orderBy = "t.id";

        auto stmtResult = db.prepare(sql::buildSelect(spec));
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = bindIds(stmt, ids);
        if (!bindResult)
            return bindResult.error();
        return collectTags(stmt);
    });
}

Result<std::optional<TagInfo>> TagCatalog::tagById(int64_t id) {
    auto tags = queryTags("t.id = ?", {id});
    if (!tags)
        return tags.error();
    if (tags.value().empty())
        return std::optional<TagInfo>{};
    return std::optional<TagInfo>{std::move(tags.value().front())};
}

Result<std::optional<TagInfo>> TagCatalog::findTag(const ParsedTag& tag) {
    auto key = normalized(tag);
    return pool_->withConnection([&](Database& db) -> Result<std::optional<TagInfo>> {
        std::optional<int64_t> namespaceId;
        if (key.ns) {
            MEDIAREPO_TRY_UNWRAP(ns, findByKey<NamespaceInfo>(db, *key.ns));
            if (!ns) {
                return std::optional<TagInfo>{};
            }
            namespaceId = ns->id;
        }
        return findByKey<TagInfo>(db, TagKey{namespaceId, key.name});
    });
}

Result<std::vector<TagInfo>> TagCatalog::tagsByNames(const std::vector<std::string>& rawTags) {
    std::vector<TagInfo> found;
    std::set<int64_t> seen;
    for (const auto& raw : rawTags) {
        auto tag = findTag(parseTag(raw));
        if (!tag)
            return tag.error();
        if (tag.value() && seen.insert(tag.value()->id).second) {
            found.push_back(std::move(*tag.value()));
        }
    }
    return found;
}

Result<std::vector<TagInfo>> TagCatalog::allTags() {
    return queryTags("", {});
}

Result<std::vector<TagInfo>> TagCatalog::tagsForFile(int64_t fileId) {
    return queryTags("t.id IN (SELECT tag_id FROM file_tags WHERE file_id = ?)", {fileId});
}

Result<std::vector<TagInfo>> TagCatalog::tagsForFiles(const std::vector<int64_t>& fileIds) {
    if (fileIds.empty()) {
        return std::vector<TagInfo>{};
    }
    return queryTags("t.id IN (SELECT tag_id FROM file_tags WHERE file_id IN (" +
                         sql::placeholders(fileIds.size()) + "))",
                     fileIds);
}

Result<std::vector<TagInfo>> TagCatalog::tagsForHashes(const std::vector<Hash>& hashes) {
    if (hashes.empty()) {
        return std::vector<TagInfo>{};
    }
    return pool_->withConnection([&](Database& db) -> Result<std::vector<TagInfo>> {
        sql::QuerySpec spec;
        spec.distinct = true;
        spec.columns = {std::string(TAG_COLUMNS)};
        spec.from = std::string(TAG_FROM);
        spec.conditions.push_back("t.id IN (SELECT ft.tag_id FROM file_tags ft "
                                  "JOIN files f ON f.id = ft.file_id "
                                  "JOIN content_descriptors c ON c.id = f.cd_id "
                                  "WHERE c.hash IN (" +
                                  sql::placeholders(hashes.size()) + "))");
        spec.orderBy = "t.id";

        auto stmtResult = db.prepare(sql::buildSelect(spec));
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        for (size_t i = 0; i < hashes.size(); ++i) {
            auto bindResult = stmt.bind(static_cast<int>(i + 1), hashes[i]);
            if (!bindResult)
                return bindResult.error();
        }
        return collectTags(stmt);
    });
}

Result<void> TagCatalog::addTagsToFile(int64_t fileId, const std::vector<int64_t>& tagIds) {
    auto ids = distinctIds(tagIds);
    return pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction(
            [&]() -> Result<void> {
                MEDIAREPO_TRY(requireFile(db, fileId));
                MEDIAREPO_TRY(requireTags(db, ids));
                return linkTags(db, fileId, ids);
            },
            TransactionMode::Immediate);
    });
}

Result<std::vector<TagInfo>> TagCatalog::changeFileTags(int64_t fileId,
                                                        const std::vector<int64_t>& addIds,
                                                        const std::vector<int64_t>& removeIds) {
    auto toAdd = distinctIds(addIds);
    auto toRemove = distinctIds(removeIds);

    auto txResult = pool_->withConnection([&](Database& db) -> Result<void> {
        return db.transaction(
            [&]() -> Result<void> {
                MEDIAREPO_TRY(requireFile(db, fileId));
                MEDIAREPO_TRY(requireTags(db, toAdd));
                MEDIAREPO_TRY(linkTags(db, fileId, toAdd));

                if (!toRemove.empty()) {
                    MEDIAREPO_TRY_UNWRAP(
                        remove, db.prepare("DELETE FROM file_tags WHERE file_id = ? AND tag_id IN (" +
                                           sql::placeholders(toRemove.size()) + ")"));
                    MEDIAREPO_TRY(remove.bind(1, fileId));
                    MEDIAREPO_TRY(bindIds(remove, toRemove, 2));
                    MEDIAREPO_TRY(remove.execute());
                }
                return {};
            },
            TransactionMode::Immediate);
    });
    if (!txResult) {
        return txResult.error();
    }

    spdlog::debug("File {}: +{} -{} tags", fileId, toAdd.size(), toRemove.size());
    return tagsForFile(fileId);
}

} // namespace mediarepo::metadata
