#pragma once

/**
 * @file find_or_create.h
 * @brief Generic insert-or-fetch over entities with a unique key
 *
 * Entities whose identity is a unique key (descriptor hash, namespace name, tag identity)
 * share one algorithm: INSERT ... ON CONFLICT DO NOTHING, then SELECT by key. The unique
 * index closes the race between concurrent creators, so every caller observes the same row.
 *
 * Each entity provides a UniqueKeyTraits specialization:
 * - Key: the natural key type
 * - selectSql: SELECT over the entity's columns (no WHERE)
 * - keyCondition: WHERE fragment matching one key
 * - insertHead, valuesRow: "INSERT INTO t (cols) VALUES " and the "(?, ...)" row for one key
 * - bindKey(): binds a key starting at a parameter index, returns the next index
 * - extract(): builds the entity from a row of selectSql
 * - keyOf(): the key of an extracted entity
 */

#include <algorithm>
#include <concepts>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/database.h>
#include <mediarepo/metadata/models.h>
#include <mediarepo/metadata/query_helpers.h>

namespace mediarepo::metadata {

/**
 * @brief Natural key of a tag: (namespace or none, name)
 */
struct TagKey {
    std::optional<int64_t> namespaceId;
    std::string name;

    auto operator<=>(const TagKey&) const = default;
};

template <typename Entity> struct UniqueKeyTraits;

template <typename Entity>
concept HasUniqueKey = requires(Statement& stmt,
                                const typename UniqueKeyTraits<Entity>::Key& key) {
    { UniqueKeyTraits<Entity>::selectSql } -> std::convertible_to<std::string_view>;
    { UniqueKeyTraits<Entity>::keyCondition } -> std::convertible_to<std::string_view>;
    { UniqueKeyTraits<Entity>::insertHead } -> std::convertible_to<std::string_view>;
    { UniqueKeyTraits<Entity>::valuesRow } -> std::convertible_to<std::string_view>;
    { UniqueKeyTraits<Entity>::bindKey(stmt, key, 1) } -> std::same_as<Result<int>>;
    { UniqueKeyTraits<Entity>::extract(stmt) } -> std::same_as<Entity>;
    {
        UniqueKeyTraits<Entity>::keyOf(UniqueKeyTraits<Entity>::extract(stmt))
    } -> std::convertible_to<typename UniqueKeyTraits<Entity>::Key>;
};

template <> struct UniqueKeyTraits<ContentDescriptor> {
    using Key = Hash;
    static constexpr std::string_view selectSql = "SELECT id, hash FROM content_descriptors";
    static constexpr std::string_view keyCondition = "hash = ?";
    static constexpr std::string_view insertHead = "INSERT INTO content_descriptors (hash) VALUES ";
    static constexpr std::string_view valuesRow = "(?)";

    static Result<int> bindKey(Statement& stmt, const Key& key, int index) {
        MEDIAREPO_TRY(stmt.bind(index, key));
        return index + 1;
    }

    static ContentDescriptor extract(const Statement& stmt) {
        return ContentDescriptor{stmt.getInt64(0), stmt.getString(1)};
    }

    static Key keyOf(const ContentDescriptor& descriptor) { return descriptor.hash; }
};

template <> struct UniqueKeyTraits<NamespaceInfo> {
    using Key = std::string;
    static constexpr std::string_view selectSql = "SELECT id, name FROM namespaces";
    static constexpr std::string_view keyCondition = "name = ?";
    static constexpr std::string_view insertHead = "INSERT INTO namespaces (name) VALUES ";
    static constexpr std::string_view valuesRow = "(?)";

    static Result<int> bindKey(Statement& stmt, const Key& key, int index) {
        MEDIAREPO_TRY(stmt.bind(index, key));
        return index + 1;
    }

    static NamespaceInfo extract(const Statement& stmt) {
        return NamespaceInfo{stmt.getInt64(0), stmt.getString(1)};
    }

    static Key keyOf(const NamespaceInfo& ns) { return ns.name; }
};

template <> struct UniqueKeyTraits<TagInfo> {
    using Key = TagKey;
    static constexpr std::string_view selectSql =
        "SELECT t.id, t.namespace_id, n.name, t.name FROM tags t "
        "LEFT JOIN namespaces n ON n.id = t.namespace_id";
    // Same expression as idx_tags_identity so the lookup can use the index
    static constexpr std::string_view keyCondition =
        "IFNULL(t.namespace_id, 0) = IFNULL(?, 0) AND t.name = ?";
    static constexpr std::string_view insertHead = "INSERT INTO tags (namespace_id, name) VALUES ";
    static constexpr std::string_view valuesRow = "(?, ?)";

    static Result<int> bindKey(Statement& stmt, const Key& key, int index) {
        MEDIAREPO_TRY(stmt.bind(index, key.namespaceId));
        MEDIAREPO_TRY(stmt.bind(index + 1, key.name));
        return index + 2;
    }

    static TagInfo extract(const Statement& stmt) {
        TagInfo tag;
        tag.id = stmt.getInt64(0);
        if (!stmt.isNull(1)) {
            tag.ns = NamespaceInfo{stmt.getInt64(1), stmt.getString(2)};
        }
        tag.name = stmt.getString(3);
        return tag;
    }

    static Key keyOf(const TagInfo& tag) {
        return TagKey{tag.ns ? std::optional<int64_t>(tag.ns->id) : std::nullopt, tag.name};
    }
};

namespace detail {

constexpr std::string_view ON_CONFLICT_IGNORE = " ON CONFLICT DO NOTHING";

// Keys per bulk statement; keeps the parameter count under SQLITE_MAX_VARIABLE_NUMBER (999)
constexpr size_t BATCH_KEYS = 200;

// SELECT every existing row among keys, adding it to found under its key
template <typename Entity>
Result<void> selectByKeys(Database& db, std::span<const typename UniqueKeyTraits<Entity>::Key> keys,
                          std::map<typename UniqueKeyTraits<Entity>::Key, Entity>& found) {
    using Traits = UniqueKeyTraits<Entity>;
    std::vector<std::string> conditions(keys.size(),
                                        "(" + std::string(Traits::keyCondition) + ")");
    std::string sql = std::string(Traits::selectSql) + " WHERE " + sql::join(conditions, " OR ");

    MEDIAREPO_TRY_UNWRAP(stmt, db.prepare(sql));
    int index = 1;
    for (const auto& key : keys) {
        MEDIAREPO_TRY_UNWRAP(next, Traits::bindKey(stmt, key, index));
        index = next;
    }

    while (true) {
        MEDIAREPO_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        auto entity = Traits::extract(stmt);
        auto key = Traits::keyOf(entity);
        found.insert_or_assign(std::move(key), std::move(entity));
    }
    return {};
}

// One multi-row INSERT ... ON CONFLICT DO NOTHING for keys
template <typename Entity>
Result<void> insertKeys(Database& db, std::span<const typename UniqueKeyTraits<Entity>::Key> keys) {
    using Traits = UniqueKeyTraits<Entity>;
    std::vector<std::string> rows(keys.size(), std::string(Traits::valuesRow));
    std::string sql =
        std::string(Traits::insertHead) + sql::join(rows, ", ") + std::string(ON_CONFLICT_IGNORE);

    MEDIAREPO_TRY_UNWRAP(stmt, db.prepare(sql));
    int index = 1;
    for (const auto& key : keys) {
        MEDIAREPO_TRY_UNWRAP(next, Traits::bindKey(stmt, key, index));
        index = next;
    }
    return stmt.execute();
}

template <typename Key, typename Func>
Result<void> forEachBatch(const std::vector<Key>& keys, Func&& func) {
    for (size_t begin = 0; begin < keys.size(); begin += BATCH_KEYS) {
        size_t count = std::min(BATCH_KEYS, keys.size() - begin);
        MEDIAREPO_TRY(func(std::span<const Key>(keys.data() + begin, count)));
    }
    return {};
}

} // namespace detail

/**
 * @brief Look up an entity by its unique key
 */
template <HasUniqueKey Entity>
Result<std::optional<Entity>> findByKey(Database& db,
                                        const typename UniqueKeyTraits<Entity>::Key& key) {
    using Traits = UniqueKeyTraits<Entity>;
    std::string sql = std::string(Traits::selectSql) + " WHERE " +
                      std::string(Traits::keyCondition) + " LIMIT 1";

    MEDIAREPO_TRY_UNWRAP(stmt, db.prepare(sql));
    MEDIAREPO_TRY(Traits::bindKey(stmt, key, 1));
    MEDIAREPO_TRY_UNWRAP(hasRow, stmt.step());

    if (!hasRow) {
        return std::optional<Entity>{};
    }
    return std::optional<Entity>{Traits::extract(stmt)};
}

/**
 * @brief Return the entity with this key, creating it if absent
 *
 * Idempotent and race-free: concurrent callers with the same key all receive the row that
 * won the insert.
 */
template <HasUniqueKey Entity>
Result<Entity> findOrCreate(Database& db, const typename UniqueKeyTraits<Entity>::Key& key) {
    using Traits = UniqueKeyTraits<Entity>;

    {
        MEDIAREPO_TRY_UNWRAP(insert,
                             db.prepare(std::string(Traits::insertHead) +
                                        std::string(Traits::valuesRow) +
                                        std::string(detail::ON_CONFLICT_IGNORE)));
        MEDIAREPO_TRY(Traits::bindKey(insert, key, 1));
        MEDIAREPO_TRY(insert.execute());
    }

    MEDIAREPO_TRY_UNWRAP(found, findByKey<Entity>(db, key));
    if (!found) {
        return Error{ErrorCode::InternalError,
                     "Row missing after insert into unique-keyed table"};
    }
    return std::move(*found);
}

/**
 * @brief Batch find-or-create
 *
 * One bulk SELECT of the rows that already exist, one multi-row INSERT of the missing keys,
 * then a bulk re-select of those; rows created concurrently by another caller are returned as
 * well. Output order follows input order; duplicate keys map to the same row. Run inside a
 * write transaction for atomicity.
 */
template <HasUniqueKey Entity>
Result<std::vector<Entity>>
findOrCreateAll(Database& db, const std::vector<typename UniqueKeyTraits<Entity>::Key>& keys) {
    using Key = typename UniqueKeyTraits<Entity>::Key;

    std::map<Key, Entity> found;
    MEDIAREPO_TRY(detail::forEachBatch(keys, [&](std::span<const Key> batch) {
        return detail::selectByKeys<Entity>(db, batch, found);
    }));

    std::vector<Key> missing;
    for (const auto& key : keys) {
        if (!found.contains(key) &&
            std::find(missing.begin(), missing.end(), key) == missing.end()) {
            missing.push_back(key);
        }
    }

    if (!missing.empty()) {
        MEDIAREPO_TRY(detail::forEachBatch(missing, [&](std::span<const Key> batch) {
            return detail::insertKeys<Entity>(db, batch);
        }));
        MEDIAREPO_TRY(detail::forEachBatch(missing, [&](std::span<const Key> batch) {
            return detail::selectByKeys<Entity>(db, batch, found);
        }));
    }

    std::vector<Entity> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        auto it = found.find(key);
        if (it == found.end()) {
            return Error{ErrorCode::InternalError,
                         "Row missing after insert into unique-keyed table"};
        }
        result.push_back(it->second);
    }
    return result;
}

} // namespace mediarepo::metadata
