#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fsnap::snapshot::model {

// Empty when digesting was disabled for the scan.
using Digest = std::vector<uint8_t>;
using Metadata = std::map<std::string, std::string>;

struct FileRecord {
    Digest digest{};
    std::string dir_name{}, base_name{};
    double created{}, modified{};
    uintmax_t size{};
    bool archived{};
    std::optional<std::string> file_group{}, file_type{};
    Metadata metadata{};

    // dir_name and base_name joined with '/'; just base_name for files at the root
    [[nodiscard]] std::string fileName() const;

    [[nodiscard]] std::string hexDigest() const;

    [[nodiscard]] bool operator==(const FileRecord& other) const = default;
};

[[nodiscard]] std::string toHex(const Digest& digest);

void to_json(nlohmann::json& j, const FileRecord& f);

}
