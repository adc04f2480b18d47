#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <optional>
#include <set>
#include <mediarepo/metadata/file_repository.h>
#include <mediarepo/metadata/query_helpers.h>
#include <mediarepo/search/query_engine.h>

namespace mediarepo::search {

using metadata::Database;
using metadata::FileInfo;
using metadata::Statement;

namespace {

std::optional<double> parseNumber(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    double number = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return number;
}

template <typename T> int threeWay(const T& a, const T& b) {
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

int compareNamespace(const FileInfo& a, const FileInfo& b, const SortKey& key,
                     const SortContext& context, bool& missingDecides) {
    missingDecides = false;
    static const std::vector<std::string> none;

    const std::vector<std::string>* va = &none;
    const std::vector<std::string>* vb = &none;
    auto nsIt = context.namespaceValues.find(key.ns);
    if (nsIt != context.namespaceValues.end()) {
        if (auto it = nsIt->second.find(a.id); it != nsIt->second.end())
            va = &it->second;
        if (auto it = nsIt->second.find(b.id); it != nsIt->second.end())
            vb = &it->second;
    }

    if (va->empty() != vb->empty()) {
        missingDecides = true;
        return va->empty() ? 1 : -1;
    }

    size_t n = std::min(va->size(), vb->size());
    for (size_t i = 0; i < n; ++i) {
        int c = compareTagValues((*va)[i], (*vb)[i]);
        if (c != 0)
            return c;
    }
    return threeWay(va->size(), vb->size());
}

int compareByKey(const FileInfo& a, const FileInfo& b, const SortKey& key,
                 const SortContext& context) {
    int c = 0;
    switch (key.kind) {
        case SortKey::Kind::FileName:
            c = threeWay(a.name.value_or(""), b.name.value_or(""));
            break;
        case SortKey::Kind::FileSize:
            c = threeWay(a.size, b.size);
            break;
        case SortKey::Kind::FileImportedTime:
            c = threeWay(a.importTime, b.importTime);
            break;
        case SortKey::Kind::FileCreatedTime:
            c = threeWay(a.creationTime, b.creationTime);
            break;
        case SortKey::Kind::FileChangeTime:
            c = threeWay(a.changeTime, b.changeTime);
            break;
        case SortKey::Kind::FileType:
            c = threeWay(static_cast<int>(a.fileType), static_cast<int>(b.fileType));
            break;
        case SortKey::Kind::NumTags: {
            auto count = [&](int64_t id) -> size_t {
                auto it = context.tagCounts.find(id);
                return it == context.tagCounts.end() ? 0 : it->second;
            };
            c = threeWay(count(a.id), count(b.id));
            break;
        }
        case SortKey::Kind::Namespace: {
            bool missingDecides = false;
            c = compareNamespace(a, b, key, context, missingDecides);
            if (missingDecides) {
                return c;
            }
            break;
        }
    }
    return key.direction == SortDirection::Descending ? -c : c;
}

} // namespace

int compareTagValues(const std::string& a, const std::string& b) {
    auto na = parseNumber(a);
    auto nb = parseNumber(b);
    if (na && nb) {
        return threeWay(*na, *nb);
    }
    return threeWay(a, b);
}

void sortFiles(std::vector<FileInfo>& files, const std::vector<SortKey>& keys,
               const SortContext& context) {
    std::stable_sort(files.begin(), files.end(), [&](const FileInfo& a, const FileInfo& b) {
        for (const auto& key : keys) {
            int c = compareByKey(a, b, key, context);
            if (c != 0)
                return c < 0;
        }
        return a.id < b.id;
    });
}

QueryEngine::QueryEngine(std::shared_ptr<metadata::ConnectionPool> pool,
                         std::shared_ptr<metadata::TagCatalog> catalog)
    : pool_(std::move(pool)), catalog_(std::move(catalog)) {}

Result<std::vector<FileInfo>> QueryEngine::findFiles(const std::vector<TagQuery>& predicates) {
    std::set<int64_t> required;
    std::set<int64_t> excluded;

    for (const auto& predicate : predicates) {
        auto parsed = metadata::parseTag(predicate.tag);
        auto tag = catalog_->findTag(parsed);
        if (!tag)
            return tag.error();

        if (!tag.value()) {
            if (!predicate.negate) {
                spdlog::debug("Query tag '{}' does not exist, no file can match",
                              metadata::formatTag(parsed));
                return std::vector<FileInfo>{};
            }
            continue;
        }

        if (predicate.negate) {
            excluded.insert(tag.value()->id);
        } else {
            required.insert(tag.value()->id);
        }
    }

    return pool_->withConnection([&](Database& db) -> Result<std::vector<FileInfo>> {
        std::string sql = metadata::fileSelectSql();
        std::vector<std::string> conditions;
        if (!required.empty()) {
            conditions.push_back("f.id IN (SELECT file_id FROM file_tags WHERE tag_id IN (" +
                                 metadata::sql::placeholders(required.size()) +
                                 ") GROUP BY file_id HAVING COUNT(DISTINCT tag_id) = ?)");
        }
        if (!excluded.empty()) {
            conditions.push_back("f.id NOT IN (SELECT file_id FROM file_tags WHERE tag_id IN (" +
                                 metadata::sql::placeholders(excluded.size()) + "))");
        }
        for (size_t i = 0; i < conditions.size(); ++i) {
            sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
        }
        sql += " ORDER BY f.id";

        auto stmtResult = db.prepare(sql);
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        int index = 1;
        for (auto id : required) {
            MEDIAREPO_TRY(stmt.bind(index++, id));
        }
        if (!required.empty()) {
            MEDIAREPO_TRY(stmt.bind(index++, static_cast<int64_t>(required.size())));
        }
        for (auto id : excluded) {
            MEDIAREPO_TRY(stmt.bind(index++, id));
        }

        std::vector<FileInfo> files;
        while (true) {
            MEDIAREPO_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            files.push_back(metadata::extractFile(stmt));
        }
        spdlog::debug("Tag query (+{} -{}) matched {} files", required.size(), excluded.size(),
                      files.size());
        return files;
    });
}

Result<std::vector<FileInfo>> QueryEngine::findFiles(const std::vector<TagQuery>& predicates,
                                                     const std::vector<SortKey>& sortKeys) {
    auto files = findFiles(predicates);
    if (!files)
        return files.error();

    auto sorted = std::move(files).value();
    MEDIAREPO_TRY(sort(sorted, sortKeys));
    return sorted;
}

Result<void> QueryEngine::sort(std::vector<FileInfo>& files, const std::vector<SortKey>& sortKeys) {
    auto context = loadSortContext(sortKeys);
    if (!context)
        return context.error();
    sortFiles(files, sortKeys, context.value());
    return {};
}

Result<SortContext> QueryEngine::loadSortContext(const std::vector<SortKey>& sortKeys) {
    bool needCounts = false;
    std::set<std::string> namespaces;
    for (const auto& key : sortKeys) {
        if (key.kind == SortKey::Kind::NumTags) {
            needCounts = true;
        } else if (key.kind == SortKey::Kind::Namespace) {
            namespaces.insert(metadata::normalizeTagName(key.ns));
        }
    }

    SortContext context;
    if (!needCounts && namespaces.empty()) {
        return context;
    }

    auto loaded = pool_->withConnection([&](Database& db) -> Result<void> {
        if (needCounts) {
            MEDIAREPO_TRY_UNWRAP(
                counts, db.prepare("SELECT file_id, COUNT(*) FROM file_tags GROUP BY file_id"));
            while (true) {
                MEDIAREPO_TRY_UNWRAP(hasRow, counts.step());
                if (!hasRow)
                    break;
                context.tagCounts[counts.getInt64(0)] = static_cast<size_t>(counts.getInt64(1));
            }
        }

        if (!namespaces.empty()) {
            MEDIAREPO_TRY_UNWRAP(values, db.prepare("SELECT n.name, ft.file_id, t.name "
                                                    "FROM file_tags ft "
                                                    "JOIN tags t ON t.id = ft.tag_id "
                                                    "JOIN namespaces n ON n.id = t.namespace_id "
                                                    "WHERE n.name IN (" +
                                                    metadata::sql::placeholders(namespaces.size()) +
                                                    ")"));
            int index = 1;
            for (const auto& ns : namespaces) {
                MEDIAREPO_TRY(values.bind(index++, ns));
            }
            while (true) {
                MEDIAREPO_TRY_UNWRAP(hasRow, values.step());
                if (!hasRow)
                    break;
                context.namespaceValues[values.getString(0)][values.getInt64(1)].push_back(
                    values.getString(2));
            }
        }
        return {};
    });
    if (!loaded)
        return loaded.error();

    for (auto& [ns, perFile] : context.namespaceValues) {
        for (auto& [fileId, names] : perFile) {
            std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
                return compareTagValues(a, b) < 0;
            });
        }
    }

    // Keys refer to the namespace as written by the caller
    for (const auto& key : sortKeys) {
        if (key.kind == SortKey::Kind::Namespace) {
            auto normalized = metadata::normalizeTagName(key.ns);
            if (normalized != key.ns && context.namespaceValues.count(normalized)) {
                context.namespaceValues[key.ns] = context.namespaceValues[normalized];
            }
        }
    }

    return context;
}

} // namespace mediarepo::search
