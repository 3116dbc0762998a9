#include <gtest/gtest.h>
#include "remote/LocalStore.hpp"
#include "error/Error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace skiff::remote;
using namespace skiff;

class LocalStoreTest : public ::testing::Test {
protected:
    fs::path root_;
    std::unique_ptr<LocalStore> store_;

    void SetUp() override {
        root_ = fs::temp_directory_path() / ("skiff_localstore_test_" + std::to_string(::getpid()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "Docs");
        std::ofstream(root_ / "Docs" / "plan.txt") << "0123456789";
        std::ofstream(root_ / "readme.md") << "hi";
        store_ = std::make_unique<LocalStore>(root_, 4);
    }

    void TearDown() override {
        fs::remove_all(root_);
    }
};

TEST_F(LocalStoreTest, ListsFoldersFirstWithRelativeIds) {
    const auto listing = store_->listChildren("root");
    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[0].id, "Docs");
    EXPECT_TRUE(listing[0].isFolder());
    EXPECT_EQ(listing[1].id, "readme.md");
    EXPECT_EQ(listing[1].size, 2u);

    EXPECT_EQ(store_->listChildren("Docs")[0].id, "Docs/plan.txt");
}

TEST_F(LocalStoreTest, IdsCannotEscapeTheRoot) {
    EXPECT_THROW(store_->listChildren("../"), NotFound);
    EXPECT_THROW(store_->getMetadata("/etc/passwd"), NotFound);
    EXPECT_THROW(store_->getMetadata("Docs/../../x"), NotFound);
    EXPECT_THROW(store_->listChildren("Nope"), NotFound);
}

TEST_F(LocalStoreTest, DownloadReportsProgressPerChunk) {
    std::ostringstream out;
    std::vector<uintmax_t> reports;
    const auto n = store_->download("Docs/plan.txt", out, [&](const uintmax_t b) { reports.push_back(b); });

    EXPECT_EQ(n, 10u);
    EXPECT_EQ(out.str(), "0123456789");
    EXPECT_EQ(reports, (std::vector<uintmax_t>{4, 8, 10}));
}

TEST_F(LocalStoreTest, UploadWritesAndReturnsNewId) {
    std::istringstream in("payload");
    const auto id = store_->upload("Docs", "new.bin", in, 7, {});
    EXPECT_EQ(id, "Docs/new.bin");
    EXPECT_EQ(store_->getMetadata(id).size, 7u);
    EXPECT_FALSE(fs::exists(root_ / "Docs" / "new.bin.upload"));
}

TEST_F(LocalStoreTest, ShortReaderIsALocalFailure) {
    std::istringstream in("abc");
    EXPECT_THROW(store_->upload("root", "short.bin", in, 10, {}), LocalIO);
    EXPECT_FALSE(fs::exists(root_ / "short.bin"));
    EXPECT_FALSE(fs::exists(root_ / "short.bin.upload"));
}

TEST_F(LocalStoreTest, CreateRenameTrashAndDelete) {
    const auto folder = store_->createFolder("root", "Archive");
    EXPECT_EQ(folder, "Archive");
    EXPECT_EQ(store_->createFolder("root", "Archive"), "Archive");
    EXPECT_THROW(store_->createFolder("root", "readme.md"), InvalidState);
    EXPECT_THROW(store_->createFolder("root", "../up"), InvalidState);

    store_->rename("readme.md", "README.md");
    EXPECT_TRUE(fs::exists(root_ / "README.md"));
    EXPECT_THROW(store_->rename("README.md", "Docs"), InvalidState);

    store_->remove("README.md", false);
    EXPECT_FALSE(fs::exists(root_ / "README.md"));
    EXPECT_TRUE(fs::exists(root_ / LocalStore::TRASH_DIR / "README.md"));
    for (const auto& e : store_->listChildren("root")) EXPECT_NE(e.name, LocalStore::TRASH_DIR);

    store_->remove("Docs", true);
    EXPECT_FALSE(fs::exists(root_ / "Docs"));
    EXPECT_THROW(store_->remove("root", true), InvalidState);
}

TEST_F(LocalStoreTest, SearchIsCaseInsensitiveAndSkipsTrash) {
    store_->remove("readme.md", false);
    const auto hits = store_->search("PLAN");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, "Docs/plan.txt");
    EXPECT_TRUE(store_->search("readme").empty());
}
