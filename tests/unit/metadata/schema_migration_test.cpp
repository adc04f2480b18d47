#include <gtest/gtest.h>
#include <mediarepo/metadata/database.h>
#include <mediarepo/metadata/migration.h>
#include "../../common/test_helpers.h"

using namespace mediarepo;
using namespace mediarepo::metadata;

class SchemaMigrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open((dir_ / "schema.db").string(), ConnectionMode::Create).has_value());
    }

    tests::TempDir dir_;
    Database db_;
};

TEST_F(SchemaMigrationTest, MigratesToLatest) {
    MigrationManager manager(db_);
    ASSERT_TRUE(manager.initialize().has_value());
    manager.registerMigrations(schemaMigrations());

    auto needs = manager.needsMigration();
    ASSERT_TRUE(needs.has_value());
    EXPECT_TRUE(needs.value());

    ASSERT_TRUE(manager.migrate().has_value());

    auto version = manager.getCurrentVersion();
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(version.value(), manager.getLatestVersion());

    for (const char* table : {"storage_locations", "content_descriptors", "files", "namespaces",
                              "tags", "file_tags", "thumbnails"}) {
        auto exists = db_.tableExists(table);
        ASSERT_TRUE(exists.has_value());
        EXPECT_TRUE(exists.value()) << table;
    }

    auto history = manager.getHistory();
    ASSERT_TRUE(history.has_value());
    EXPECT_EQ(static_cast<int>(history.value().size()), manager.getLatestVersion());
}

TEST_F(SchemaMigrationTest, MigrateTwiceIsNoop) {
    ASSERT_TRUE(migrateToLatest(db_).has_value());
    ASSERT_TRUE(migrateToLatest(db_).has_value());

    MigrationManager manager(db_);
    ASSERT_TRUE(manager.initialize().has_value());
    manager.registerMigrations(schemaMigrations());
    auto needs = manager.needsMigration();
    ASSERT_TRUE(needs.has_value());
    EXPECT_FALSE(needs.value());
}

TEST_F(SchemaMigrationTest, TagIdentityIsUniqueWithoutNamespace) {
    ASSERT_TRUE(migrateToLatest(db_).has_value());

    ASSERT_TRUE(db_.execute("INSERT INTO tags (namespace_id, name) VALUES (NULL, 'sky')").has_value());
    auto duplicate = db_.execute("INSERT INTO tags (namespace_id, name) VALUES (NULL, 'sky')");
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Conflict);
}

TEST_F(SchemaMigrationTest, DescriptorHashIsUnique) {
    ASSERT_TRUE(migrateToLatest(db_).has_value());

    ASSERT_TRUE(db_.execute("INSERT INTO content_descriptors (hash) VALUES ('abc')").has_value());
    auto duplicate = db_.execute("INSERT INTO content_descriptors (hash) VALUES ('abc')");
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Conflict);
}
