#include <gtest/gtest.h>
#include "transfer/Manager.hpp"
#include "transfer/tasks/Upload.hpp"
#include "transfer/tasks/Download.hpp"
#include "transfer/tasks/FolderUpload.hpp"
#include "transfer/tasks/FolderDownload.hpp"
#include "cache/Loader.hpp"
#include "support/MemoryStore.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace skiff::transfer;
using namespace skiff::transfer::model;
using namespace skiff;

namespace {

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

const test::MemoryStore::Node* findChild(const std::vector<test::MemoryStore::Node>& nodes, const std::string& name) {
    for (const auto& n : nodes)
        if (n.entry.name == name) return &n;
    return nullptr;
}

}

class TransferTasksTest : public ::testing::Test {
protected:
    fs::path dir_;
    std::shared_ptr<test::MemoryStore> store_ = std::make_shared<test::MemoryStore>();
    std::shared_ptr<cache::Registry> cache_ = std::make_shared<cache::Registry>(config::CachingConfig{});
    std::shared_ptr<cache::Loader> loader_;
    Manager manager_;
    config::TransfersConfig cfg_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("skiff_tasks_test_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        loader_ = std::make_shared<cache::Loader>(cache_, store_, 1);
    }

    void TearDown() override {
        loader_->stop();
        fs::remove_all(dir_);
    }

    tasks::Context context() { return {manager_, store_, loader_, cfg_}; }

    // Runs the task inline the way a pool worker would, after the ownership handoff
    template <typename T>
    bool runTask(const std::string& transferId) {
        EXPECT_TRUE(manager_.acquire(transferId));
        T task(context(), transferId);
        auto done = task.promise.get_future();
        task();
        EXPECT_FALSE(manager_.isOwned(transferId));
        return done.get();
    }

    Transfer uploadFolder(const fs::path& local, const std::string& parent = "root") {
        return manager_.createTransfer(local.string(), parent, Direction::Upload, Kind::Folder, local.filename().string());
    }

    // top/a.txt, top/b.tif, top/sub/c.txt, top/sub/deeper/d.txt
    fs::path makeTree() {
        const auto top = dir_ / "top";
        writeFile(top / "a.txt", "alpha");
        writeFile(top / "b.tif", "tiff");
        writeFile(top / "sub" / "c.txt", "charlie");
        writeFile(top / "sub" / "deeper" / "d.txt", "delta");
        return top;
    }
};

TEST_F(TransferTasksTest, SingleUploadSendsTheFile) {
    writeFile(dir_ / "report.pdf", "pdfbytes");
    const auto t = manager_.createTransfer((dir_ / "report.pdf").string(), "root", Direction::Upload,
                                           Kind::SingleFile, "report.pdf", 8);

    EXPECT_TRUE(runTask<tasks::Upload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    EXPECT_EQ(snap.bytes_transferred, 8u);
    ASSERT_TRUE(snap.result_id.has_value());
    EXPECT_EQ(store_->contentOf(*snap.result_id), "pdfbytes");
}

TEST_F(TransferTasksTest, SingleUploadSkipsExistingName) {
    store_->addFile("root", "report.pdf", "older");
    writeFile(dir_ / "report.pdf", "newer");
    const auto t = manager_.createTransfer((dir_ / "report.pdf").string(), "root", Direction::Upload,
                                           Kind::SingleFile, "report.pdf", 5);

    EXPECT_TRUE(runTask<tasks::Upload>(t.id));
    EXPECT_EQ(store_->uploadCalls.load(), 0u);
    EXPECT_EQ(manager_.getTransfer(t.id).bytes_transferred, 0u);
}

TEST_F(TransferTasksTest, SingleUploadPermissionFailureIsDistinct) {
    writeFile(dir_ / "secret.txt", "x");
    store_->failName("secret.txt", ErrorCode::PermissionDenied);
    const auto t = manager_.createTransfer((dir_ / "secret.txt").string(), "root", Direction::Upload,
                                           Kind::SingleFile, "secret.txt", 1);

    EXPECT_FALSE(runTask<tasks::Upload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Error);
    EXPECT_EQ(snap.error_code.value(), ErrorCode::PermissionDenied);
    EXPECT_NE(snap.error->find("re-authenticate"), std::string::npos);
}

TEST_F(TransferTasksTest, MissingLocalFileIsLocalIO) {
    const auto t = manager_.createTransfer((dir_ / "gone.txt").string(), "root", Direction::Upload,
                                           Kind::SingleFile, "gone.txt", 1);
    EXPECT_FALSE(runTask<tasks::Upload>(t.id));
    EXPECT_EQ(manager_.getTransfer(t.id).error_code.value(), ErrorCode::LocalIO);
}

TEST_F(TransferTasksTest, FolderUploadMirrorsTreeAndReusesFolders) {
    const auto top = makeTree();
    const auto existing = store_->addFolder("root", "top");
    store_->addFile(existing, "a.txt", "alpha");

    const auto t = uploadFolder(top);
    EXPECT_TRUE(runTask<tasks::FolderUpload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    EXPECT_EQ(snap.result_id.value(), existing);
    ASSERT_EQ(snap.files.size(), 3u);   // b.tif is excluded

    const auto* a = snap.findFile((top / "a.txt").string());
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->status, FileStatus::Skipped);

    const auto* d = snap.findFile((top / "sub" / "deeper" / "d.txt").string());
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->status, FileStatus::Completed);
    EXPECT_EQ(d->relative_dir, "sub/deeper");
    EXPECT_EQ(store_->contentOf(d->result_id.value()), "delta");

    EXPECT_EQ(store_->childrenOf("root").size(), 1u);
    const auto topChildren = store_->childrenOf(existing);
    EXPECT_NE(findChild(topChildren, "sub"), nullptr);
    EXPECT_EQ(findChild(topChildren, "b.tif"), nullptr);
    EXPECT_EQ(store_->uploadCalls.load(), 2u);
}

TEST_F(TransferTasksTest, FolderUploadCreatesNewFoldersWhenReuseIsOff) {
    const auto top = makeTree();
    store_->addFolder("root", "top");
    cfg_.use_existing_folders = false;

    const auto t = uploadFolder(top);
    EXPECT_TRUE(runTask<tasks::FolderUpload>(t.id));

    EXPECT_EQ(store_->childrenOf("root").size(), 2u);
    EXPECT_EQ(manager_.getTransfer(t.id).failedFiles().size(), 0u);
}

TEST_F(TransferTasksTest, FailedFileDoesNotStopSiblingsAndRetryResumesOnlyIt) {
    const auto top = makeTree();
    store_->failName("c.txt", ErrorCode::RemoteUnavailable);

    const auto t = uploadFolder(top);
    EXPECT_FALSE(runTask<tasks::FolderUpload>(t.id));

    auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::CompletedWithErrors);
    const auto cId = (top / "sub" / "c.txt").string();
    EXPECT_EQ(snap.findFile(cId)->status, FileStatus::Error);
    EXPECT_EQ(snap.findFile((top / "a.txt").string())->status, FileStatus::Completed);
    EXPECT_EQ(snap.findFile((top / "sub" / "deeper" / "d.txt").string())->status, FileStatus::Completed);
    const auto uploadsBefore = store_->uploadCalls.load();

    store_->clearFailures();
    manager_.retryFailedFiles(t.id, std::vector<std::string>{cId});
    EXPECT_TRUE(runTask<tasks::FolderUpload>(t.id));

    snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    EXPECT_EQ(snap.findFile(cId)->retry_count, 1u);
    EXPECT_EQ(store_->uploadCalls.load(), uploadsBefore + 1);
    EXPECT_EQ(snap.files.size(), 3u);
}

TEST_F(TransferTasksTest, CancelStopsAtTheNextFileBoundary) {
    const auto top = dir_ / "many";
    for (int i = 0; i < 5; ++i) writeFile(top / ("f" + std::to_string(i) + ".txt"), "data");

    const auto t = uploadFolder(top);
    store_->beforeTransfer = [this, id = t.id](const std::string&) {
        if (!manager_.isCancelled(id)) manager_.cancelTransfer(id);
    };

    EXPECT_FALSE(runTask<tasks::FolderUpload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Cancelled);
    EXPECT_EQ(store_->uploadCalls.load(), 1u);
    EXPECT_EQ(snap.files[0].status, FileStatus::Completed);   // in-flight file finishes
    for (size_t i = 1; i < snap.files.size(); ++i) EXPECT_EQ(snap.files[i].status, FileStatus::Pending);
}

TEST_F(TransferTasksTest, EmptyFolderCompletes) {
    fs::create_directories(dir_ / "empty");
    const auto t = uploadFolder(dir_ / "empty");

    EXPECT_TRUE(runTask<tasks::FolderUpload>(t.id));
    EXPECT_EQ(manager_.getTransfer(t.id).status, TransferStatus::Completed);
    EXPECT_TRUE(manager_.getTransfer(t.id).files.empty());
}

TEST_F(TransferTasksTest, UnreadableRootFailsTheWholeTransfer) {
    const auto t = uploadFolder(dir_ / "missing");
    EXPECT_FALSE(runTask<tasks::FolderUpload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Error);
    EXPECT_EQ(snap.error_code.value(), ErrorCode::NotFound);
}

TEST_F(TransferTasksTest, FolderDownloadWritesTreeAndSkipsLocalDuplicates) {
    const auto album = store_->addFolder("root", "Album");
    store_->addFile(album, "one.jpg", "111");
    const auto disc = store_->addFolder(album, "Disc 2");
    store_->addFile(disc, "two.jpg", "2222");

    const auto dest = dir_ / "downloads";
    writeFile(dest / "Album" / "one.jpg", "local copy");

    const auto t = manager_.createTransfer(album, dest.string(), Direction::Download, Kind::Folder, "Album");
    EXPECT_TRUE(runTask<tasks::FolderDownload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    ASSERT_EQ(snap.files.size(), 2u);
    EXPECT_EQ(snap.files[0].status, FileStatus::Skipped);
    EXPECT_EQ(snap.files[1].status, FileStatus::Completed);
    EXPECT_EQ(snap.files[1].relative_dir, "Disc 2");

    EXPECT_EQ(readFile(dest / "Album" / "one.jpg"), "local copy");
    EXPECT_EQ(readFile(dest / "Album" / "Disc 2" / "two.jpg"), "2222");
    EXPECT_FALSE(fs::exists(dest / "Album" / "Disc 2" / "two.jpg.part"));
}

TEST_F(TransferTasksTest, FolderDownloadOfUnlistableFolderFails) {
    const auto album = store_->addFolder("root", "Album");
    store_->failListing(album);

    const auto t = manager_.createTransfer(album, dir_.string(), Direction::Download, Kind::Folder, "Album");
    EXPECT_FALSE(runTask<tasks::FolderDownload>(t.id));
    EXPECT_EQ(manager_.getTransfer(t.id).error_code.value(), ErrorCode::RemoteUnavailable);
}

TEST_F(TransferTasksTest, UnlistableSubfolderIsRecordedAndRetryWalksIt) {
    const auto album = store_->addFolder("root", "Album");
    store_->addFile(album, "one.jpg", "111");
    const auto disc = store_->addFolder(album, "Disc 2");
    store_->addFile(disc, "two.jpg", "2222");
    store_->failListing(disc);

    const auto dest = dir_ / "downloads";
    const auto t = manager_.createTransfer(album, dest.string(), Direction::Download, Kind::Folder, "Album");
    EXPECT_FALSE(runTask<tasks::FolderDownload>(t.id));

    auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::CompletedWithErrors);
    EXPECT_EQ(snap.findFile(disc)->status, FileStatus::Error);
    EXPECT_TRUE(snap.findFile(disc)->isFolder());
    EXPECT_EQ(snap.findFile(disc)->error_code.value(), ErrorCode::RemoteUnavailable);

    const auto errors = manager_.listErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].file.id, disc);

    store_->clearFailures();
    EXPECT_EQ(manager_.retryFailedFiles(t.id), std::vector<std::string>{disc});
    EXPECT_TRUE(runTask<tasks::FolderDownload>(t.id));

    snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    EXPECT_EQ(snap.findFile(disc)->status, FileStatus::Completed);
    ASSERT_EQ(snap.files.size(), 3u);
    EXPECT_EQ(snap.files[2].name, "two.jpg");
    EXPECT_EQ(snap.files[2].relative_dir, "Disc 2");
    EXPECT_EQ(readFile(dest / "Album" / "Disc 2" / "two.jpg"), "2222");
}

TEST_F(TransferTasksTest, SubfolderThatCannotBeCreatedFailsAloneAndRetries) {
    const auto top = makeTree();
    writeFile(top / "zeta" / "z.txt", "zulu");
    store_->failName("sub", ErrorCode::QuotaExceeded);

    const auto t = uploadFolder(top);
    EXPECT_FALSE(runTask<tasks::FolderUpload>(t.id));

    const auto subId = (top / "sub").string();
    auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::CompletedWithErrors);
    ASSERT_NE(snap.findFile(subId), nullptr);
    EXPECT_TRUE(snap.findFile(subId)->isFolder());
    EXPECT_EQ(snap.findFile(subId)->error_code.value(), ErrorCode::QuotaExceeded);
    EXPECT_EQ(snap.findFile((top / "zeta" / "z.txt").string())->status, FileStatus::Completed);
    EXPECT_EQ(snap.findFile((top / "a.txt").string())->status, FileStatus::Completed);
    EXPECT_EQ(snap.findFile((top / "sub" / "c.txt").string()), nullptr);

    store_->clearFailures();
    manager_.retryFailedFiles(t.id);
    EXPECT_TRUE(runTask<tasks::FolderUpload>(t.id));

    snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    EXPECT_EQ(snap.findFile(subId)->status, FileStatus::Completed);
    const auto* d = snap.findFile((top / "sub" / "deeper" / "d.txt").string());
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->relative_dir, "sub/deeper");
    EXPECT_EQ(store_->contentOf(d->result_id.value()), "delta");
}

TEST_F(TransferTasksTest, DanglingLinkDoesNotFailTheFolderUpload) {
    const auto top = dir_ / "links";
    writeFile(top / "a.txt", "alpha");
    writeFile(top / "b.txt", "bravo");
    fs::create_symlink(top / "nowhere", top / "dangling");

    const auto t = uploadFolder(top);
    EXPECT_TRUE(runTask<tasks::FolderUpload>(t.id));

    const auto snap = manager_.getTransfer(t.id);
    EXPECT_EQ(snap.status, TransferStatus::Completed);
    EXPECT_EQ(snap.files.size(), 2u);
    EXPECT_EQ(store_->uploadCalls.load(), 2u);
}

TEST_F(TransferTasksTest, FailedDownloadLeavesNoPartialFile) {
    const auto id = store_->addFile("root", "big.iso", "isodata");
    store_->failName("big.iso", ErrorCode::RemoteUnavailable);

    const auto t = manager_.createTransfer(id, dir_.string(), Direction::Download, Kind::SingleFile, "big.iso", 7);
    EXPECT_FALSE(runTask<tasks::Download>(t.id));

    EXPECT_FALSE(fs::exists(dir_ / "big.iso"));
    EXPECT_FALSE(fs::exists(dir_ / "big.iso.part"));

    store_->clearFailures();
    manager_.retryFailedFiles(t.id);
    EXPECT_TRUE(runTask<tasks::Download>(t.id));
    EXPECT_EQ(readFile(dir_ / "big.iso"), "isodata");
    EXPECT_EQ(manager_.getTransfer(t.id).result_id.value(), (dir_ / "big.iso").string());
}
