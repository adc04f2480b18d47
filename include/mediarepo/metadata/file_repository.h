#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/models.h>

namespace mediarepo::metadata {

/**
 * @brief Values for a new file row
 */
struct NewFile {
    ContentDescriptor descriptor;
    int64_t storageId = 0;
    std::optional<std::string> mimeType;
    std::optional<std::string> name;
    int64_t size = 0;
    TimePoint creationTime;
    TimePoint changeTime;
    TimePoint importTime;
};

// SELECT over files joined with their descriptor; rows are read back with extractFile()
std::string fileSelectSql();
FileInfo extractFile(const Statement& stmt);

/**
 * @brief Storage locations and file rows
 */
class FileRepository {
public:
    explicit FileRepository(std::shared_ptr<ConnectionPool> pool);

    // Storage locations
    /**
     * @brief Register a location; re-adding the same name and path returns the existing row
     *
     * A name or path already bound to a different partner fails with Conflict.
     */
    Result<StorageLocation> addStorageLocation(const std::string& name, const std::string& path);
    Result<std::vector<StorageLocation>> storageLocations();
    Result<std::optional<StorageLocation>> storageByName(const std::string& name);
    Result<std::optional<StorageLocation>> storageByPath(const std::string& path);
    Result<std::optional<StorageLocation>> storageById(int64_t id);

    // Files
    Result<FileInfo> insertFile(const NewFile& file);
    Result<std::optional<FileInfo>> fileById(int64_t id);
    Result<std::optional<FileInfo>> fileByHash(const Hash& hash);
    Result<std::vector<FileInfo>> filesByIds(const std::vector<int64_t>& ids);
    Result<std::vector<FileInfo>> allFiles();

    Result<FileInfo> updateName(int64_t id, const std::optional<std::string>& name);
    Result<FileInfo> updateComment(int64_t id, const std::optional<std::string>& comment);
    Result<FileInfo> setStatus(int64_t id, FileStatus status);

private:
    std::shared_ptr<ConnectionPool> pool_;

    Result<std::optional<StorageLocation>> storageWhere(const std::string& condition,
                                                        const std::string& value);
    Result<FileInfo> updateColumn(int64_t id, const std::string& column,
                                  const std::optional<std::string>& value);
};

} // namespace mediarepo::metadata
