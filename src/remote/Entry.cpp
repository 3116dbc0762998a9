#include "remote/Entry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace skiff::remote {

std::string to_string(const Kind kind) {
    switch (kind) {
        case Kind::File: return "file";
        case Kind::Folder: return "folder";
        default: return "unknown";
    }
}

Kind to_kind(const std::string& str) {
    if (str == "file") return Kind::File;
    if (str == "folder") return Kind::Folder;
    throw std::invalid_argument("Invalid entry kind: " + str);
}

std::string lowercase(std::string str) {
    std::ranges::transform(str.begin(), str.end(), str.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

void sortListing(Listing& entries) {
    std::ranges::stable_sort(entries, [](const Entry& a, const Entry& b) {
        if (a.isFolder() != b.isFolder()) return a.isFolder();
        return lowercase(a.name) < lowercase(b.name);
    });
}

void to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"id", e.id},
        {"name", e.name},
        {"kind", to_string(e.kind)},
        {"size", e.size},
        {"modified", util::timestampToString(e.modified)}
    };
}

void from_json(const nlohmann::json& j, Entry& e) {
    e.id = j.at("id").get<std::string>();
    e.name = j.at("name").get<std::string>();
    e.kind = to_kind(j.at("kind").get<std::string>());
    e.size = j.value("size", static_cast<uintmax_t>(0));
    e.modified = j.contains("modified") ? util::parseTimestampFromString(j.at("modified").get<std::string>()) : 0;
}

}
