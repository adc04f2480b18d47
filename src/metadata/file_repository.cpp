#include <spdlog/spdlog.h>
#include <mediarepo/metadata/file_repository.h>
#include <mediarepo/metadata/query_helpers.h>

namespace mediarepo::metadata {

std::string fileSelectSql() {
    return "SELECT f.id, f.cd_id, c.hash, f.storage_id, f.status, f.file_type, f.mime_type, "
           "f.name, f.comment, f.size, f.creation_time, f.change_time, f.import_time "
           "FROM files f JOIN content_descriptors c ON c.id = f.cd_id";
}

FileInfo extractFile(const Statement& stmt) {
    FileInfo info;
    info.id = stmt.getInt64(0);
    info.descriptor.id = stmt.getInt64(1);
    info.descriptor.hash = stmt.getString(2);
    info.storageId = stmt.getInt64(3);
    info.status = static_cast<FileStatus>(stmt.getInt(4));
    info.fileType = static_cast<FileType>(stmt.getInt(5));
    info.mimeType = stmt.getOptionalString(6);
    info.name = stmt.getOptionalString(7);
    info.comment = stmt.getOptionalString(8);
    info.size = stmt.getInt64(9);
    info.creationTime = fromUnixSeconds(stmt.getInt64(10));
    info.changeTime = fromUnixSeconds(stmt.getInt64(11));
    info.importTime = fromUnixSeconds(stmt.getInt64(12));
    return info;
}

namespace {

StorageLocation extractStorage(const Statement& stmt) {
    return StorageLocation{stmt.getInt64(0), stmt.getString(1), stmt.getString(2)};
}

Result<std::vector<FileInfo>> collectFiles(Statement& stmt) {
    std::vector<FileInfo> files;
    while (true) {
        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            break;
        files.push_back(extractFile(stmt));
    }
    return files;
}

} // namespace

FileRepository::FileRepository(std::shared_ptr<ConnectionPool> pool) : pool_(std::move(pool)) {}

Result<StorageLocation> FileRepository::addStorageLocation(const std::string& name,
                                                           const std::string& path) {
    if (name.empty() || path.empty()) {
        return Error{ErrorCode::InvalidArgument, "Storage name and path must not be empty"};
    }

    return pool_->withConnection([&](Database& db) -> Result<StorageLocation> {
        auto insertResult = db.prepare("INSERT INTO storage_locations (name, path) VALUES (?, ?) "
                                       "ON CONFLICT DO NOTHING");
        if (!insertResult)
            return insertResult.error();

        Statement insert = std::move(insertResult).value();
        auto bindResult = insert.bindAll(name, path);
        if (!bindResult)
            return bindResult.error();
        auto execResult = insert.execute();
        if (!execResult)
            return execResult.error();

        auto selectResult =
            db.prepare("SELECT id, name, path FROM storage_locations WHERE name = ? OR path = ?");
        if (!selectResult)
            return selectResult.error();

        Statement select = std::move(selectResult).value();
        bindResult = select.bindAll(name, path);
        if (!bindResult)
            return bindResult.error();

        std::optional<StorageLocation> match;
        while (true) {
            auto stepResult = select.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            auto location = extractStorage(select);
            if (location.name != name || location.path != path) {
                return Error{ErrorCode::Conflict,
                             fmt::format("Storage '{}' at {} conflicts with '{}' at {}", name,
                                         path, location.name, location.path)};
            }
            match = std::move(location);
        }

        if (!match) {
            return Error{ErrorCode::InternalError, "Storage location missing after insert"};
        }
        spdlog::debug("Storage location '{}' -> {}", match->name, match->path);
        return std::move(*match);
    });
}

Result<std::vector<StorageLocation>> FileRepository::storageLocations() {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<StorageLocation>> {
        auto stmtResult = db.prepare("SELECT id, name, path FROM storage_locations ORDER BY id");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        std::vector<StorageLocation> locations;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            locations.push_back(extractStorage(stmt));
        }
        return locations;
    });
}

Result<std::optional<StorageLocation>> FileRepository::storageWhere(const std::string& condition,
                                                                    const std::string& value) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<StorageLocation>> {
        auto stmtResult =
            db.prepare("SELECT id, name, path FROM storage_locations WHERE " + condition);
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, value);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<StorageLocation>{};
        return std::optional<StorageLocation>{extractStorage(stmt)};
    });
}

Result<std::optional<StorageLocation>> FileRepository::storageByName(const std::string& name) {
    return storageWhere("name = ?", name);
}

Result<std::optional<StorageLocation>> FileRepository::storageByPath(const std::string& path) {
    return storageWhere("path = ?", path);
}

Result<std::optional<StorageLocation>> FileRepository::storageById(int64_t id) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<StorageLocation>> {
        auto stmtResult = db.prepare("SELECT id, name, path FROM storage_locations WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, id);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<StorageLocation>{};
        return std::optional<StorageLocation>{extractStorage(stmt)};
    });
}

Result<FileInfo> FileRepository::insertFile(const NewFile& file) {
    auto fileId = pool_->withConnection([&](Database& db) -> Result<int64_t> {
        auto stmtResult = db.prepare(R"(
            INSERT INTO files (cd_id, storage_id, status, file_type, mime_type, name, size,
                               creation_time, change_time, import_time)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(
            file.descriptor.id, file.storageId, static_cast<int>(FileStatus::Imported),
            static_cast<int>(fileTypeFromMime(file.mimeType)), file.mimeType, file.name, file.size,
            toUnixSeconds(file.creationTime), toUnixSeconds(file.changeTime),
            toUnixSeconds(file.importTime));
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();

        return db.lastInsertRowId();
    });
    if (!fileId)
        return fileId.error();

    auto inserted = fileById(fileId.value());
    if (!inserted)
        return inserted.error();
    if (!inserted.value()) {
        return Error{ErrorCode::InternalError, "File row missing after insert"};
    }
    spdlog::debug("Inserted file {} for content {}", fileId.value(), file.descriptor.hash);
    return std::move(*inserted.value());
}

Result<std::optional<FileInfo>> FileRepository::fileById(int64_t id) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<FileInfo>> {
        auto stmtResult = db.prepare(fileSelectSql() + " WHERE f.id = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, id);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<FileInfo>{};
        return std::optional<FileInfo>{extractFile(stmt)};
    });
}

Result<std::optional<FileInfo>> FileRepository::fileByHash(const Hash& hash) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<FileInfo>> {
        auto stmtResult = db.prepare(fileSelectSql() + " WHERE c.hash = ? ORDER BY f.id LIMIT 1");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, hash);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<FileInfo>{};
        return std::optional<FileInfo>{extractFile(stmt)};
    });
}

Result<std::vector<FileInfo>> FileRepository::filesByIds(const std::vector<int64_t>& ids) {
    if (ids.empty()) {
        return std::vector<FileInfo>{};
    }

    return pool_->withConnection([&](Database& db) -> Result<std::vector<FileInfo>> {
        auto stmtResult = db.prepare(fileSelectSql() + " WHERE f.id IN (" +
                                     sql::placeholders(ids.size()) + ") ORDER BY f.id");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        for (size_t i = 0; i < ids.size(); ++i) {
            auto bindResult = stmt.bind(static_cast<int>(i + 1), ids[i]);
            if (!bindResult)
                return bindResult.error();
        }
        return collectFiles(stmt);
    });
}

Result<std::vector<FileInfo>> FileRepository::allFiles() {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<FileInfo>> {
        auto stmtResult = db.prepare(fileSelectSql() + " ORDER BY f.id");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        return collectFiles(stmt);
    });
}

Result<FileInfo> FileRepository::updateColumn(int64_t id, const std::string& column,
                                              const std::optional<std::string>& value) {
    auto updated = pool_->withConnection([&](Database& db) -> Result<int> {
        auto stmtResult = db.prepare("UPDATE files SET " + column + " = ? WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(value, id);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();
        return db.changes();
    });
    if (!updated)
        return updated.error();
    if (updated.value() == 0) {
        return Error{ErrorCode::NotFound, fmt::format("File {} not found", id)};
    }

    auto file = fileById(id);
    if (!file)
        return file.error();
    if (!file.value()) {
        return Error{ErrorCode::NotFound, fmt::format("File {} not found", id)};
    }
    return std::move(*file.value());
}

Result<FileInfo> FileRepository::updateName(int64_t id, const std::optional<std::string>& name) {
    return updateColumn(id, "name", name);
}

Result<FileInfo> FileRepository::updateComment(int64_t id,
                                               const std::optional<std::string>& comment) {
    return updateColumn(id, "comment", comment);
}

Result<FileInfo> FileRepository::setStatus(int64_t id, FileStatus status) {
    auto updated = pool_->withConnection([&](Database& db) -> Result<int> {
        auto stmtResult = db.prepare("UPDATE files SET status = ? WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(static_cast<int>(status), id);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();
        return db.changes();
    });
    if (!updated)
        return updated.error();
    if (updated.value() == 0) {
        return Error{ErrorCode::NotFound, fmt::format("File {} not found", id)};
    }

    auto file = fileById(id);
    if (!file)
        return file.error();
    if (!file.value()) {
        return Error{ErrorCode::NotFound, fmt::format("File {} not found", id)};
    }
    return std::move(*file.value());
}

} // namespace mediarepo::metadata
