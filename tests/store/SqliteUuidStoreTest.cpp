#include "uuidres/store/SqliteUuidStore.hpp"
#include "uuidres/store/SqliteDb.hpp"
#include "uuidres/rt/ThreadPool.hpp"
#include "support/TempDir.hpp"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <string>

using namespace uuidres;
using namespace uuidres::store;

class SqliteUuidStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_shared<rt::ThreadPool>(2);
        store_ = std::make_unique<SqliteUuidStore>(dir_.path(), kMapSize, pool_);
    }

    void reopen() {
        store_.reset();
        store_ = std::make_unique<SqliteUuidStore>(dir_.path(), kMapSize, pool_);
    }

    static constexpr std::uint64_t kMapSize = 1073741824;

    test::TempDir dir_;
    std::shared_ptr<rt::ThreadPool> pool_;
    std::unique_ptr<SqliteUuidStore> store_;
};

TEST_F(SqliteUuidStoreTest, CreatesSubdirectoryAndFile) {
    EXPECT_TRUE(std::filesystem::is_directory(dir_.path() / "index_uuids"));
    EXPECT_TRUE(std::filesystem::exists(SqliteUuidStore::dbPath(dir_.path())));
}

TEST_F(SqliteUuidStoreTest, CreateThenGet) {
    auto created = awaitStore(store_->createUuid("movies", true));
    ASSERT_TRUE(created) << created.error().describe();

    auto got = awaitStore(store_->getUuid("movies"));
    ASSERT_TRUE(got);
    ASSERT_TRUE(got->has_value());
    EXPECT_EQ(**got, *created);
}

TEST_F(SqliteUuidStoreTest, StrictCreateRejectsExisting) {
    auto first = awaitStore(store_->createUuid("movies", true));
    ASSERT_TRUE(first);

    auto second = awaitStore(store_->createUuid("movies", true));
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::NameAlreadyExists);

    auto got = awaitStore(store_->getUuid("movies"));
    ASSERT_TRUE(got && got->has_value());
    EXPECT_EQ(**got, *first);
}

TEST_F(SqliteUuidStoreTest, LenientCreateReturnsExisting) {
    auto first = awaitStore(store_->createUuid("movies", true));
    ASSERT_TRUE(first);

    auto again = awaitStore(store_->createUuid("movies", false));
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, *first);

    auto all = awaitStore(store_->list());
    ASSERT_TRUE(all);
    EXPECT_EQ(all->size(), 1u);
}

TEST_F(SqliteUuidStoreTest, GetMissingIsEmptyNotError) {
    auto got = awaitStore(store_->getUuid("nothing"));
    ASSERT_TRUE(got);
    EXPECT_FALSE(got->has_value());
}

TEST_F(SqliteUuidStoreTest, RemoveReturnsRemovedUuid) {
    auto created = awaitStore(store_->createUuid("movies", true));
    ASSERT_TRUE(created);

    auto removed = awaitStore(store_->remove("movies"));
    ASSERT_TRUE(removed);
    ASSERT_TRUE(removed->has_value());
    EXPECT_EQ(**removed, *created);

    auto got = awaitStore(store_->getUuid("movies"));
    ASSERT_TRUE(got);
    EXPECT_FALSE(got->has_value());
}

TEST_F(SqliteUuidStoreTest, RemoveMissingIsEmpty) {
    auto removed = awaitStore(store_->remove("nothing"));
    ASSERT_TRUE(removed);
    EXPECT_FALSE(removed->has_value());
}

TEST_F(SqliteUuidStoreTest, InsertIsUpsert) {
    Uuid a = newUuidV4();
    Uuid b = newUuidV4();

    ASSERT_TRUE(awaitStore(store_->insert("movies", a)));
    auto got = awaitStore(store_->getUuid("movies"));
    ASSERT_TRUE(got && got->has_value());
    EXPECT_EQ(**got, a);

    ASSERT_TRUE(awaitStore(store_->insert("movies", b)));
    got = awaitStore(store_->getUuid("movies"));
    ASSERT_TRUE(got && got->has_value());
    EXPECT_EQ(**got, b);
}

TEST_F(SqliteUuidStoreTest, ListReturnsEveryEntry) {
    auto empty = awaitStore(store_->list());
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());

    for (const char* n : {"a", "b", "c"}) {
        ASSERT_TRUE(awaitStore(store_->createUuid(n, true)));
    }

    auto all = awaitStore(store_->list());
    ASSERT_TRUE(all);
    ASSERT_EQ(all->size(), 3u);

    std::set<std::string> names;
    std::set<std::string> ids;
    for (auto& e : *all) {
        names.insert(e.name);
        ids.insert(toString(e.uuid));
    }
    EXPECT_EQ(names, (std::set<std::string>{"a", "b", "c"}));
    EXPECT_EQ(ids.size(), 3u);
}

TEST_F(SqliteUuidStoreTest, DataSurvivesReopen) {
    auto created = awaitStore(store_->createUuid("movies", true));
    ASSERT_TRUE(created);

    reopen();

    auto got = awaitStore(store_->getUuid("movies"));
    ASSERT_TRUE(got && got->has_value());
    EXPECT_EQ(**got, *created);
}

TEST_F(SqliteUuidStoreTest, CorruptValueIsDecodingError) {
    ASSERT_TRUE(awaitStore(store_->createUuid("movies", true)));
    ASSERT_TRUE(awaitStore(store_->createUuid("books", true)));
    store_.reset();

    {
        SqliteDb raw(SqliteUuidStore::dbPath(dir_.path()).string(), kMapSize);
        raw.exec("UPDATE index_uuids SET uuid = x'0102' WHERE name = 'movies';");
    }
    reopen();

    auto got = awaitStore(store_->getUuid("movies"));
    ASSERT_FALSE(got);
    EXPECT_EQ(got.error().code, ErrorCode::Decoding);

    auto all = awaitStore(store_->list());
    ASSERT_FALSE(all);
    EXPECT_EQ(all.error().code, ErrorCode::Decoding);

    auto removed = awaitStore(store_->remove("movies"));
    ASSERT_FALSE(removed);
    EXPECT_EQ(removed.error().code, ErrorCode::Decoding);

    // untouched entries still resolve
    auto books = awaitStore(store_->getUuid("books"));
    ASSERT_TRUE(books && books->has_value());
}

TEST_F(SqliteUuidStoreTest, MapSizeLimitSurfacesAsStorageError) {
    store_.reset();
    test::TempDir small;
    SqliteUuidStore tiny(small.path(), 16 * 4096, pool_);

    const std::string pad(200, 'x');
    Error last{ErrorCode::Storage, {}};
    bool failed = false;
    for (int i = 0; i < 5000 && !failed; ++i) {
        auto r = awaitStore(tiny.insert(pad + std::to_string(i), newUuidV4()));
        if (!r) {
            failed = true;
            last = r.error();
        }
    }
    ASSERT_TRUE(failed);
    EXPECT_EQ(last.code, ErrorCode::Storage);
}

TEST_F(SqliteUuidStoreTest, FailedCreateLeavesNoRecord) {
    ASSERT_TRUE(awaitStore(store_->createUuid("movies", true)));
    ASSERT_FALSE(awaitStore(store_->createUuid("movies", true)));

    // the rejected write transaction was rolled back; the next write works
    ASSERT_TRUE(awaitStore(store_->createUuid("books", true)));
    auto all = awaitStore(store_->list());
    ASSERT_TRUE(all);
    EXPECT_EQ(all->size(), 2u);
}

TEST(SqliteUuidStoreOpenTest, NullPoolRejected) {
    test::TempDir dir;
    EXPECT_THROW(SqliteUuidStore(dir.path(), 1 << 20, nullptr), std::invalid_argument);
}

TEST(SqliteUuidStoreOpenTest, UnusableDirectoryThrowsStoreError) {
    test::TempDir dir;
    auto blocker = dir.path() / "file";
    { std::ofstream(blocker.string()) << "x"; }
    auto pool = std::make_shared<rt::ThreadPool>(1);
    // dataDir is a regular file: the index_uuids sub-directory cannot exist
    try {
        SqliteUuidStore store(blocker, 1 << 20, pool);
        FAIL() << "opened a store under a regular file";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.code(), SQLITE_CANTOPEN);
    }
}

TEST(SqliteUuidStoreOpenTest, StoppedPoolReportsTaskFailed) {
    test::TempDir dir;
    auto pool = std::make_shared<rt::ThreadPool>(1);
    SqliteUuidStore store(dir.path(), 1 << 20, pool);
    pool->shutdown();

    auto r = awaitStore(store.getUuid("movies"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TaskFailed);
}
