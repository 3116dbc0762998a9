#include <gtest/gtest.h>
#include "cache/Loader.hpp"
#include "support/MemoryStore.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace skiff::cache;
using namespace skiff;
using namespace std::chrono_literals;

class LoaderTest : public ::testing::Test {
protected:
    std::shared_ptr<test::MemoryStore> store_ = std::make_shared<test::MemoryStore>();
    std::shared_ptr<Registry> cache_ = std::make_shared<Registry>(config::CachingConfig{});
    std::unique_ptr<Loader> loader_;

    void SetUp() override {
        loader_ = std::make_unique<Loader>(cache_, store_, 2);
    }
};

TEST_F(LoaderTest, AsyncLoadPopulatesCacheAndNotifies) {
    const auto docs = store_->addFolder("root", "Docs");
    store_->addFile(docs, "b.txt", "bb");
    store_->addFile(docs, "a.txt", "a");
    store_->addFolder(docs, "zeta");

    LoadResult seen;
    auto done = loader_->load(ListingKey::remote(docs), [&seen](const LoadResult& r) { seen = r; });
    ASSERT_EQ(done.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(done.get());

    ASSERT_TRUE(seen.ok());
    ASSERT_EQ(seen.entries->size(), 3u);
    EXPECT_EQ(seen.entries->at(0).name, "zeta");   // folders first
    EXPECT_EQ(seen.entries->at(1).name, "a.txt");

    const auto cached = cache_->get(ListingKey::remote(docs));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->size(), 3u);
}

TEST_F(LoaderTest, FailureIsReportedAsMissWithReason) {
    store_->failListing("root");

    LoadResult seen;
    auto done = loader_->load(ListingKey::remote("root"), [&seen](const LoadResult& r) { seen = r; });
    ASSERT_EQ(done.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(done.get());

    EXPECT_FALSE(seen.ok());
    EXPECT_EQ(seen.error, ErrorCode::RemoteUnavailable);
    EXPECT_NE(seen.reason.find("timed out"), std::string::npos);
    EXPECT_FALSE(cache_->get(ListingKey::remote("root")).has_value());
}

TEST_F(LoaderTest, UnknownFolderIsNotFound) {
    const auto result = loader_->tryRefresh(ListingKey::remote("ghost"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorCode::NotFound);
    EXPECT_THROW(loader_->fetch(ListingKey::remote("ghost")), NotFound);
}

TEST_F(LoaderTest, FetchServesFreshCacheWithoutCallingTheStore) {
    store_->addFile("root", "one.txt", "1");

    (void)loader_->fetch(ListingKey::remote("root"));
    (void)loader_->fetch(ListingKey::remote("root"));
    EXPECT_EQ(store_->listCalls.load(), 1u);

    cache_->invalidate(ListingKey::remote("root"));
    (void)loader_->fetch(ListingKey::remote("root"));
    EXPECT_EQ(store_->listCalls.load(), 2u);
}

TEST_F(LoaderTest, ConcurrentLoadsOfTheSameKeyAreBothServed) {
    store_->addFile("root", "one.txt", "1");

    auto first = loader_->load(ListingKey::remote("root"));
    auto second = loader_->load(ListingKey::remote("root"));
    EXPECT_TRUE(first.get());
    EXPECT_TRUE(second.get());
    EXPECT_EQ(store_->listCalls.load(), 2u);
    EXPECT_TRUE(cache_->get(ListingKey::remote("root")).has_value());
}

TEST_F(LoaderTest, LocalScopeListsTheFilesystem) {
    const auto dir = fs::temp_directory_path() / ("skiff_loader_test_" + std::to_string(::getpid()));
    fs::create_directories(dir / "sub");
    std::ofstream(dir / "file.bin") << "12345";

    const auto listing = loader_->fetch(ListingKey::local(dir.string()));
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[0].name, "sub");
    EXPECT_TRUE(listing[0].isFolder());
    EXPECT_EQ(listing[1].name, "file.bin");
    EXPECT_EQ(listing[1].size, 5u);
    EXPECT_EQ(listing[1].id, (dir / "file.bin").string());

    EXPECT_THROW(loader_->fetch(ListingKey::local((dir / "missing").string())), NotFound);

    fs::remove_all(dir);
}

TEST_F(LoaderTest, LocalListingSkipsEntriesThatAreNotFilesOrFolders) {
    const auto dir = fs::temp_directory_path() / ("skiff_loader_links_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::ofstream(dir / "a.txt") << "a";
    std::ofstream(dir / "b.txt") << "bb";
    fs::create_symlink(dir / "nowhere", dir / "dangling");

    const auto listing = Loader::listLocal(dir);
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[0].name, "a.txt");
    EXPECT_EQ(listing[1].name, "b.txt");
    EXPECT_EQ(listing[1].size, 2u);

    fs::remove_all(dir);
}
