#pragma once

#include "util/errors.hpp"

#include <map>
#include <string>
#include <string_view>

namespace fsnap::db::encoding {

inline constexpr char TAG_DELIMITER = '/';
inline constexpr char TAG_VALUE_DELIMITER = ':';

inline bool isEncodable(const std::string_view s) {
    return s.find(TAG_DELIMITER) == std::string_view::npos && s.find(TAG_VALUE_DELIMITER) == std::string_view::npos;
}

inline bool isEncodable(const std::map<std::string, std::string>& tags) {
    for (const auto& [k, v] : tags)
        if (!isEncodable(k) || !isEncodable(v)) return false;
    return true;
}

// "/k1:v1/k2:v2/", keys in sorted order; the empty map encodes as "".
inline std::string to_tag_string(const std::map<std::string, std::string>& tags) {
    if (tags.empty()) return {};

    std::string out(1, TAG_DELIMITER);
    for (const auto& [k, v] : tags) {
        if (!isEncodable(k) || !isEncodable(v))
            throw TagFormatError("Tag cannot be encoded: " + k + TAG_VALUE_DELIMITER + v);
        out += k;
        out += TAG_VALUE_DELIMITER;
        out += v;
        out += TAG_DELIMITER;
    }
    return out;
}

inline std::map<std::string, std::string> from_tag_string(const std::string_view s) {
    std::map<std::string, std::string> out;

    size_t start = 0;
    while (start <= s.size()) {
        auto end = s.find(TAG_DELIMITER, start);
        if (end == std::string_view::npos) end = s.size();

        if (const auto tag = s.substr(start, end - start); !tag.empty()) {
            const auto sep = tag.find(TAG_VALUE_DELIMITER);
            if (sep == std::string_view::npos || tag.find(TAG_VALUE_DELIMITER, sep + 1) != std::string_view::npos)
                throw TagFormatError("Bad tag format: " + std::string(tag));
            out.emplace(std::string(tag.substr(0, sep)), std::string(tag.substr(sep + 1)));
        }

        start = end + 1;
    }

    return out;
}

}
