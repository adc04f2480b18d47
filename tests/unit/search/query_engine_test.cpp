#include <gtest/gtest.h>
#include <algorithm>
#include <mediarepo/metadata/file_repository.h>
#include <mediarepo/metadata/tag_catalog.h>
#include <mediarepo/search/query_engine.h>
#include <mediarepo/storage/content_store.h>
#include "../../common/test_helpers.h"

using namespace mediarepo;
using namespace mediarepo::metadata;
using namespace mediarepo::search;

namespace {

std::vector<int64_t> idsOf(const std::vector<FileInfo>& files) {
    std::vector<int64_t> ids;
    for (const auto& f : files)
        ids.push_back(f.id);
    return ids;
}

FileInfo makeFile(int64_t id, std::string name, int64_t size) {
    FileInfo file;
    file.id = id;
    file.name = std::move(name);
    file.size = size;
    return file;
}

} // namespace

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = tests::open_migrated_pool(dir_ / "query.db");
        ASSERT_TRUE(pool_);
        files_ = std::make_shared<FileRepository>(pool_);
        catalog_ = std::make_shared<TagCatalog>(pool_);
        content_ = std::make_shared<storage::ContentStore>(pool_);
        engine_ = std::make_unique<QueryEngine>(pool_, catalog_);

        auto location = files_->addStorageLocation("main", (dir_ / "main").string());
        ASSERT_TRUE(location.has_value());
        location_ = location.value();
    }

    FileInfo addTaggedFile(const std::string& content, const std::string& name,
                           const std::vector<std::string>& tags) {
        auto descriptor = content_->store(location_, toBytes(content));
        EXPECT_TRUE(descriptor.has_value());

        NewFile file;
        file.descriptor = descriptor.value();
        file.storageId = location_.id;
        file.name = name;
        file.size = static_cast<int64_t>(content.size());
        auto inserted = files_->insertFile(file);
        EXPECT_TRUE(inserted.has_value());

        std::vector<int64_t> tagIds;
        for (const auto& raw : tags) {
            auto tag = catalog_->findOrCreateTag(std::string_view(raw));
            EXPECT_TRUE(tag.has_value());
            tagIds.push_back(tag.value().id);
        }
        EXPECT_TRUE(catalog_->addTagsToFile(inserted.value().id, tagIds).has_value());
        return inserted.value();
    }

    tests::TempDir dir_;
    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<FileRepository> files_;
    std::shared_ptr<TagCatalog> catalog_;
    std::shared_ptr<storage::ContentStore> content_;
    std::unique_ptr<QueryEngine> engine_;
    StorageLocation location_;
};

TEST_F(QueryEngineTest, ConjunctionWithNegation) {
    auto f1 = addTaggedFile("one", "one", {"character:alice", "landscape"});
    auto f2 = addTaggedFile("two", "two", {"character:alice"});
    addTaggedFile("three", "three", {"landscape"});

    auto result = engine_->findFiles({{"character:alice", false}, {"landscape", true}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(idsOf(result.value()), std::vector<int64_t>{f2.id});

    auto both = engine_->findFiles({{"character:alice", false}, {"landscape", false}});
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(idsOf(both.value()), std::vector<int64_t>{f1.id});
}

TEST_F(QueryEngineTest, UnknownPositiveTagMatchesNothing) {
    addTaggedFile("one", "one", {"sky"});

    auto result = engine_->findFiles({{"does:not_exist", false}});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(QueryEngineTest, UnknownNegatedTagIsIgnored) {
    auto f1 = addTaggedFile("one", "one", {"sky"});
    auto f2 = addTaggedFile("two", "two", {"sea"});

    auto result = engine_->findFiles({{"does:not_exist", true}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(idsOf(result.value()), (std::vector<int64_t>{f1.id, f2.id}));
}

TEST_F(QueryEngineTest, EmptyQueryReturnsAllFiles) {
    addTaggedFile("one", "one", {});
    addTaggedFile("two", "two", {"sea"});

    auto result = engine_->findFiles({});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().size(), 2u);
}

TEST_F(QueryEngineTest, TagStringsAreNormalized) {
    auto f1 = addTaggedFile("one", "one", {"character:alice"});

    auto result = engine_->findFiles({{" Character : ALICE ", false}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(idsOf(result.value()), std::vector<int64_t>{f1.id});
}

TEST_F(QueryEngineTest, SortByNamespaceNumerically) {
    auto p10 = addTaggedFile("a", "a", {"page:10", "set"});
    auto p2 = addTaggedFile("b", "b", {"page:2", "set"});
    auto none = addTaggedFile("c", "c", {"set"});

    std::vector<SortKey> asc{SortKey::byNamespace("page")};
    auto result = engine_->findFiles({{"set", false}}, asc);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(idsOf(result.value()), (std::vector<int64_t>{p2.id, p10.id, none.id}));

    std::vector<SortKey> desc{SortKey::byNamespace("page", SortDirection::Descending)};
    auto reversed = engine_->findFiles({{"set", false}}, desc);
    ASSERT_TRUE(reversed.has_value());
    EXPECT_EQ(idsOf(reversed.value()), (std::vector<int64_t>{p10.id, p2.id, none.id}));
}

TEST_F(QueryEngineTest, SortByTagCount) {
    auto few = addTaggedFile("a", "a", {"x"});
    auto many = addTaggedFile("b", "b", {"x", "y", "z"});

    std::vector<SortKey> keys{SortKey{SortKey::Kind::NumTags, SortDirection::Descending, ""}};
    auto result = engine_->findFiles({}, keys);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(idsOf(result.value()), (std::vector<int64_t>{many.id, few.id}));
}

TEST(SortFilesTest, KeysFallThroughToId) {
    std::vector<FileInfo> files{makeFile(3, "b", 10), makeFile(1, "a", 10),
                                makeFile(2, "a", 5)};

    sortFiles(files,
              {SortKey{SortKey::Kind::FileSize, SortDirection::Descending, ""},
               SortKey{SortKey::Kind::FileName, SortDirection::Ascending, ""}},
              SortContext{});
    EXPECT_EQ(idsOf(files), (std::vector<int64_t>{1, 3, 2}));

    sortFiles(files, {SortKey{SortKey::Kind::FileName, SortDirection::Ascending, ""}},
              SortContext{});
    EXPECT_EQ(idsOf(files), (std::vector<int64_t>{1, 2, 3}));
}

TEST(SortFilesTest, CompareTagValues) {
    EXPECT_LT(compareTagValues("2", "10"), 0);
    EXPECT_GT(compareTagValues("b", "a"), 0);
    EXPECT_LT(compareTagValues("10", "9a"), 0);
    EXPECT_EQ(compareTagValues("1.5", "1.50"), 0);
}
