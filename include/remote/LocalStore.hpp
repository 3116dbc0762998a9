#pragma once

#include "remote/Store.hpp"
#include "config/Config.hpp"

#include <filesystem>

namespace skiff::remote {

// Store backed by a directory tree. Ids are paths relative to the root,
// the root itself is "root". Trashed entries move under TRASH_DIR.
class LocalStore final : public Store {
public:
    static constexpr const char* TRASH_DIR = ".skiff-trash";

    explicit LocalStore(std::filesystem::path root, uintmax_t chunkSize = config::DEFAULT_CHUNK_SIZE_BYTES);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    Listing listChildren(const std::string& folderId) override;
    Entry getMetadata(const std::string& id) override;
    uintmax_t download(const std::string& fileId, std::ostream& writer, const ProgressCallback& progress) override;
    std::string upload(const std::string& parentId, const std::string& name,
                       std::istream& reader, uintmax_t size, const ProgressCallback& progress) override;
    std::string createFolder(const std::string& parentId, const std::string& name) override;
    void remove(const std::string& id, bool permanent) override;
    void rename(const std::string& id, const std::string& newName) override;
    Listing search(const std::string& query) override;

private:
    std::filesystem::path root_;
    uintmax_t chunkSize_;

    [[nodiscard]] std::filesystem::path resolve(const std::string& id) const;
    [[nodiscard]] std::filesystem::path resolveExisting(const std::string& id) const;
    [[nodiscard]] std::string idFor(const std::filesystem::path& abs) const;
    [[nodiscard]] Entry makeEntry(const std::filesystem::path& abs) const;
};

}
