#include "snapshot/model/FileRecord.hpp"

#include <nlohmann/json.hpp>

using namespace fsnap::snapshot::model;

std::string FileRecord::fileName() const {
    if (dir_name.empty()) return base_name;
    return dir_name + '/' + base_name;
}

std::string FileRecord::hexDigest() const { return toHex(digest); }

std::string fsnap::snapshot::model::toHex(const Digest& digest) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (const auto b : digest) {
        out.push_back(HEX[b >> 4]);
        out.push_back(HEX[b & 0x0f]);
    }
    return out;
}

void fsnap::snapshot::model::to_json(nlohmann::json& j, const FileRecord& f) {
    j = {
        {"$type", "FileRecord"},
        {"digest", f.hexDigest()},
        {"dir_name", f.dir_name},
        {"base_name", f.base_name},
        {"file_name", f.fileName()},
        {"created", f.created},
        {"modified", f.modified},
        {"size", f.size},
        {"archived", f.archived},
        {"metadata", f.metadata}
    };

    if (f.file_group) j["file_group"] = *f.file_group;
    else j["file_group"] = nullptr;

    if (f.file_type) j["file_type"] = *f.file_type;
    else j["file_type"] = nullptr;
}
