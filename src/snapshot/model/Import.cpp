#include "snapshot/model/Import.hpp"
#include "util/errors.hpp"

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace fsnap::snapshot::model;

ImportId fsnap::snapshot::model::newImportId() {
    thread_local boost::uuids::random_generator generator;
    return generator();
}

std::string fsnap::snapshot::model::toHex(const ImportId& id) {
    auto out = boost::uuids::to_string(id);
    std::erase(out, '-');
    return out;
}

ImportId fsnap::snapshot::model::parseImportId(const std::string& s) {
    std::string hex;
    hex.reserve(s.size());
    for (const char c : s) if (c != '-') hex.push_back(c);

    if (hex.size() != 32 || !std::ranges::all_of(hex, [](const unsigned char c) { return std::isxdigit(c); }))
        throw std::invalid_argument("Invalid import id: '" + s + "'");

    try {
        boost::uuids::string_generator gen;
        return gen(hex);
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument("Invalid import id: '" + s + "': " + e.what());
    }
}

Tags fsnap::snapshot::model::normalizeTags(const Tags& tags) {
    Tags out;
    for (const auto& [k, v] : tags) {
        const auto first = k.find_first_not_of(" \t");
        const auto last = k.find_last_not_of(" \t");
        std::string key = first == std::string::npos ? std::string{} : k.substr(first, last - first + 1);
        std::ranges::transform(key, key.begin(), [](const unsigned char c) { return std::tolower(c); });
        if (!out.emplace(key, v).second)
            throw TagFormatError("Tag key '" + k + "' collides with another key normalized to '" + key + "'");
    }
    return out;
}

void fsnap::snapshot::model::to_json(nlohmann::json& j, const Import& i) {
    j = {
        {"id", toHex(i.id)},
        {"timestamp", i.timestamp},
        {"name", i.name},
        {"tags", i.tags}
    };
}
