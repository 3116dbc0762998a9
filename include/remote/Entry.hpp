#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace skiff::remote {

enum class Kind { File, Folder };

std::string to_string(Kind kind);
Kind to_kind(const std::string& str);

struct Entry {
    std::string id;
    std::string name;
    Kind kind = Kind::File;
    uintmax_t size = 0;
    std::time_t modified = 0;

    [[nodiscard]] bool isFolder() const { return kind == Kind::Folder; }
};

using Listing = std::vector<Entry>;

// Folders first, then files; case-insensitive by name within each group
void sortListing(Listing& entries);

std::string lowercase(std::string str);

void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

}
