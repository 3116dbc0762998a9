#include "remote/LocalStore.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <vector>

using namespace skiff::remote;
using namespace skiff;

namespace fs = std::filesystem;

namespace {

std::time_t toTimeT(const fs::file_time_type& ftime) {
    using namespace std::chrono;
    const auto sys = time_point_cast<system_clock::duration>(ftime - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(sys);
}

[[noreturn]] void rethrowStoreError(const fs::filesystem_error& e) {
    if (e.code() == std::errc::no_such_file_or_directory) throw NotFound(e.what());
    if (e.code() == std::errc::permission_denied || e.code() == std::errc::operation_not_permitted)
        throw PermissionDenied(e.what());
    if (e.code() == std::errc::no_space_on_device) throw QuotaExceeded(e.what());
    throw RemoteUnavailable(e.what());
}

void validateName(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        throw InvalidState("Invalid entry name: '" + name + "'");
}

}

LocalStore::LocalStore(fs::path root, const uintmax_t chunkSize)
    : root_(fs::weakly_canonical(std::move(root))), chunkSize_(std::max<uintmax_t>(1, chunkSize)) {
    if (!fs::is_directory(root_)) throw NotFound("Store root is not a directory: " + root_.string());
}

fs::path LocalStore::resolve(const std::string& id) const {
    if (id.empty() || id == rootId()) return root_;

    const fs::path rel(id);
    if (rel.is_absolute()) throw NotFound("Unknown id: " + id);
    for (const auto& part : rel)
        if (part == ".." || part == TRASH_DIR) throw NotFound("Unknown id: " + id);

    return root_ / rel;
}

fs::path LocalStore::resolveExisting(const std::string& id) const {
    auto abs = resolve(id);
    if (!fs::exists(abs)) throw NotFound("No such entry: " + id);
    return abs;
}

std::string LocalStore::idFor(const fs::path& abs) const {
    if (abs == root_) return rootId();
    return abs.lexically_relative(root_).generic_string();
}

Entry LocalStore::makeEntry(const fs::path& abs) const {
    Entry e;
    e.id = idFor(abs);
    e.name = abs == root_ ? rootId() : abs.filename().string();
    e.kind = fs::is_directory(abs) ? Kind::Folder : Kind::File;
    e.size = e.isFolder() ? 0 : fs::file_size(abs);
    e.modified = toTimeT(fs::last_write_time(abs));
    return e;
}

Listing LocalStore::listChildren(const std::string& folderId) {
    try {
        const auto dir = resolveExisting(folderId);
        if (!fs::is_directory(dir)) throw NotFound("Not a folder: " + folderId);

        Listing out;
        for (const auto& de : fs::directory_iterator(dir)) {
            if (de.path().filename() == TRASH_DIR) continue;
            out.push_back(makeEntry(de.path()));
        }
        sortListing(out);
        return out;
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
}

Entry LocalStore::getMetadata(const std::string& id) {
    try {
        return makeEntry(resolveExisting(id));
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
}

uintmax_t LocalStore::download(const std::string& fileId, std::ostream& writer, const ProgressCallback& progress) {
    fs::path src;
    try {
        src = resolveExisting(fileId);
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
    if (fs::is_directory(src)) throw InvalidState("Cannot download a folder as a file: " + fileId);

    std::ifstream in(src, std::ios::binary);
    if (!in) throw RemoteUnavailable("Failed to open for reading: " + fileId);

    std::vector<char> buffer(chunkSize_);
    uintmax_t total = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = in.gcount();
        if (n <= 0) break;
        writer.write(buffer.data(), n);
        if (!writer) throw LocalIO("Failed writing downloaded bytes for " + fileId);
        total += static_cast<uintmax_t>(n);
        if (progress) progress(total);
    }

    if (in.bad()) throw RemoteUnavailable("Read error while downloading " + fileId);
    return total;
}

std::string LocalStore::upload(const std::string& parentId, const std::string& name,
                               std::istream& reader, const uintmax_t size, const ProgressCallback& progress) {
    validateName(name);

    fs::path dest, tmp;
    try {
        const auto parent = resolveExisting(parentId);
        if (!fs::is_directory(parent)) throw NotFound("Upload parent is not a folder: " + parentId);
        dest = parent / name;
        tmp = parent / (name + ".upload");
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw RemoteUnavailable("Failed to open upload target: " + dest.string());

        std::vector<char> buffer(chunkSize_);
        uintmax_t total = 0;
        while (total < size) {
            const auto want = std::min<uintmax_t>(buffer.size(), size - total);
            reader.read(buffer.data(), static_cast<std::streamsize>(want));
            const auto n = reader.gcount();
            if (n <= 0) {
                out.close();
                std::error_code ec;
                fs::remove(tmp, ec);
                throw LocalIO("Short read uploading " + name + ": expected " + std::to_string(size) +
                              " bytes, got " + std::to_string(total));
            }
            out.write(buffer.data(), n);
            if (!out) {
                out.close();
                std::error_code ec;
                fs::remove(tmp, ec);
                throw QuotaExceeded("Failed writing " + name + " to the store");
            }
            total += static_cast<uintmax_t>(n);
            if (progress) progress(total);
        }
    }

    try {
        fs::rename(tmp, dest);
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }

    log::Registry::remote()->debug("[LocalStore] Uploaded {} ({} bytes)", dest.string(), size);
    return idFor(dest);
}

std::string LocalStore::createFolder(const std::string& parentId, const std::string& name) {
    validateName(name);
    try {
        const auto parent = resolveExisting(parentId);
        const auto dir = parent / name;
        if (fs::exists(dir) && !fs::is_directory(dir))
            throw InvalidState("A file named '" + name + "' already exists in " + parentId);
        fs::create_directory(dir);
        return idFor(dir);
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
}

void LocalStore::remove(const std::string& id, const bool permanent) {
    if (id.empty() || id == rootId()) throw InvalidState("Refusing to remove the store root");

    try {
        const auto abs = resolveExisting(id);
        if (permanent) {
            fs::remove_all(abs);
            return;
        }

        const auto trash = root_ / TRASH_DIR;
        fs::create_directories(trash);
        auto target = trash / abs.filename();
        for (unsigned int i = 1; fs::exists(target); ++i)
            target = trash / (abs.filename().string() + "." + std::to_string(i));
        fs::rename(abs, target);
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
}

void LocalStore::rename(const std::string& id, const std::string& newName) {
    if (id.empty() || id == rootId()) throw InvalidState("Refusing to rename the store root");
    validateName(newName);

    try {
        const auto abs = resolveExisting(id);
        const auto target = abs.parent_path() / newName;
        if (fs::exists(target)) throw InvalidState("An entry named '" + newName + "' already exists");
        fs::rename(abs, target);
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
}

Listing LocalStore::search(const std::string& query) {
    const auto needle = lowercase(query);
    Listing out;
    try {
        for (auto it = fs::recursive_directory_iterator(root_); it != fs::recursive_directory_iterator(); ++it) {
            if (it->path().filename() == TRASH_DIR) {
                it.disable_recursion_pending();
                continue;
            }
            if (lowercase(it->path().filename().string()).find(needle) != std::string::npos)
                out.push_back(makeEntry(it->path()));
        }
    } catch (const fs::filesystem_error& e) {
        rethrowStoreError(e);
    }
    sortListing(out);
    return out;
}
