#include "transfer/Controller.hpp"
#include "transfer/Manager.hpp"
#include "transfer/tasks/Upload.hpp"
#include "transfer/tasks/Download.hpp"
#include "transfer/tasks/FolderUpload.hpp"
#include "transfer/tasks/FolderDownload.hpp"
#include "concurrency/ThreadPool.hpp"
#include "remote/Store.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

using namespace skiff::transfer;
using namespace skiff::transfer::model;
using namespace skiff;

namespace fs = std::filesystem;

Controller::Controller(Manager& manager, std::shared_ptr<remote::Store> store,
                       std::shared_ptr<cache::Loader> loader, config::TransfersConfig cfg)
    : manager_(manager),
      store_(std::move(store)),
      loader_(std::move(loader)),
      config_(std::move(cfg)),
      pool_(std::make_unique<concurrency::ThreadPool>("transfers", config_.max_concurrent_transfers)) {}

Controller::~Controller() {
    stop();
}

void Controller::stop() {
    pool_->stop();
}

unsigned int Controller::workerCount() const {
    return pool_->workerCount();
}

Controller::Dispatched Controller::upload(const fs::path& localPath, const std::string& parentId) {
    auto path = fs::absolute(localPath).lexically_normal();
    if (!path.has_filename()) path = path.parent_path();
    if (!fs::exists(path)) throw NotFound("No such file or directory: " + path.string());

    const bool folder = fs::is_directory(path);
    const auto size = folder ? 0 : fs::file_size(path);

    auto transfer = manager_.createTransfer(path.string(), parentId, Direction::Upload,
                                            folder ? Kind::Folder : Kind::SingleFile,
                                            path.filename().string(), size);
    log::Registry::audit()->info("[Controller] upload {} -> {} (transfer {})", path.string(), parentId, transfer.id);

    if (!manager_.acquire(transfer.id))
        throw InvalidState("Transfer " + transfer.id + " is already owned by a worker");

    auto done = submit(transfer);
    return {std::move(transfer), std::move(done)};
}

Controller::Dispatched Controller::download(const std::string& remoteId, const fs::path& localDir) {
    const auto meta = store_->getMetadata(remoteId);
    const auto dir = fs::absolute(localDir).lexically_normal();

    auto transfer = manager_.createTransfer(remoteId, dir.string(), Direction::Download,
                                            meta.isFolder() ? Kind::Folder : Kind::SingleFile,
                                            meta.name, meta.size);
    log::Registry::audit()->info("[Controller] download {} ({}) -> {} (transfer {})",
                                 meta.name, remoteId, dir.string(), transfer.id);

    if (!manager_.acquire(transfer.id))
        throw InvalidState("Transfer " + transfer.id + " is already owned by a worker");

    auto done = submit(transfer);
    return {std::move(transfer), std::move(done)};
}

void Controller::cancel(const std::string& transferId) {
    manager_.cancelTransfer(transferId);
    log::Registry::audit()->info("[Controller] cancel {}", transferId);
}

std::optional<std::future<bool>> Controller::retry(const std::string& transferId,
                                                   const std::optional<std::vector<std::string>>& fileIds) {
    if (!manager_.acquire(transferId))
        throw InvalidState("Transfer " + transferId + " is still running");

    std::vector<std::string> retried;
    try {
        retried = manager_.retryFailedFiles(transferId, fileIds);
    } catch (const Error&) {
        manager_.release(transferId);
        throw;
    }

    if (retried.empty()) {
        manager_.release(transferId);
        return std::nullopt;
    }

    log::Registry::audit()->info("[Controller] retry {} ({} file(s))", transferId, retried.size());
    return submit(manager_.getTransfer(transferId));
}

std::vector<std::string> Controller::clearCompleted() {
    auto removed = manager_.clearCompleted();
    log::Registry::audit()->info("[Controller] clear-completed removed {}", removed.size());
    return removed;
}

std::future<bool> Controller::submit(const Transfer& transfer) {
    tasks::Context ctx{manager_, store_, loader_, config_};
    std::shared_ptr<tasks::TransferTask> task;

    if (transfer.direction == Direction::Upload) {
        if (transfer.isFolder()) task = std::make_shared<tasks::FolderUpload>(ctx, transfer.id);
        else task = std::make_shared<tasks::Upload>(ctx, transfer.id);
    } else {
        if (transfer.isFolder()) task = std::make_shared<tasks::FolderDownload>(ctx, transfer.id);
        else task = std::make_shared<tasks::Download>(ctx, transfer.id);
    }

    auto future = task->promise.get_future();

    try {
        pool_->submit(task);
    } catch (const std::runtime_error&) {
        manager_.release(transfer.id);
        throw;
    }

    log::Registry::transfer()->debug("[Controller] Dispatched transfer {}", transfer.id);
    return future;
}
