#pragma once

#include "remote/Entry.hpp"

#include <functional>
#include <iosfwd>
#include <string>

namespace skiff::remote {

// Called with the cumulative byte count after each chunk
using ProgressCallback = std::function<void(uintmax_t bytesSoFar)>;

// Primitive operations against a hierarchical object store.
// Implementations report failures with the skiff::Error family
// (NotFound, RemoteUnavailable, PermissionDenied, QuotaExceeded).
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual std::string rootId() const { return "root"; }

    virtual Listing listChildren(const std::string& folderId) = 0;

    virtual Entry getMetadata(const std::string& id) = 0;

    // Returns the number of bytes written to `writer`
    virtual uintmax_t download(const std::string& fileId, std::ostream& writer, const ProgressCallback& progress) = 0;

    // Returns the id of the new file
    virtual std::string upload(const std::string& parentId, const std::string& name,
                               std::istream& reader, uintmax_t size, const ProgressCallback& progress) = 0;

    virtual std::string createFolder(const std::string& parentId, const std::string& name) = 0;

    virtual void remove(const std::string& id, bool permanent) = 0;

    virtual void rename(const std::string& id, const std::string& newName) = 0;

    virtual Listing search(const std::string& query) = 0;
};

}
