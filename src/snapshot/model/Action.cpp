#include "snapshot/model/Action.hpp"

#include <nlohmann/json.hpp>

using namespace fsnap::snapshot::model;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

}

std::string_view fsnap::snapshot::model::typeName(const Action& action) {
    return std::visit(overloaded{
        [](const Created&) { return std::string_view{"Created"}; },
        [](const Removed&) { return std::string_view{"Removed"}; },
        [](const Copied&) { return std::string_view{"Copied"}; },
        [](const Moved&) { return std::string_view{"Moved"}; },
        [](const Renamed&) { return std::string_view{"Renamed"}; },
        [](const Archived&) { return std::string_view{"Archived"}; },
        [](const Modified&) { return std::string_view{"Modified"}; },
    }, action);
}

const FileRecord& fsnap::snapshot::model::subject(const Action& action) {
    return std::visit(overloaded{
        [](const Created& a) -> const FileRecord& { return a.next; },
        [](const Copied& a) -> const FileRecord& { return a.copy; },
        [](const auto& a) -> const FileRecord& { return a.original; },
    }, action);
}

FileRecord fsnap::snapshot::model::apply(const FileRecord& record, const Action& action) {
    FileRecord out = record;
    std::visit(overloaded{
        [&](const Moved& a) {
            out.dir_name = a.dir_name;
            out.metadata = a.metadata;
        },
        [&](const Renamed& a) {
            out.base_name = a.base_name;
            out.metadata = a.metadata;
        },
        [&](const Archived& a) {
            out.dir_name = a.dir_name;
            out.archived = true;
            out.metadata = a.metadata;
        },
        [&](const Modified& a) {
            out.modified = a.modified;
            out.size = a.size;
            out.digest = a.digest;
        },
        [](const Created&) {},
        [](const Removed&) {},
        [](const Copied&) {},
    }, action);
    return out;
}

void fsnap::snapshot::model::to_json(nlohmann::json& j, const Action& action) {
    j = nlohmann::json::object();
    j["$type"] = typeName(action);

    std::visit(overloaded{
        [&](const Created& a) { j["new"] = a.next; },
        [&](const Removed& a) { j["original"] = a.original; },
        [&](const Copied& a) {
            j["original"] = a.original;
            j["copy"] = a.copy;
        },
        [&](const Moved& a) {
            j["original"] = a.original;
            j["dir_name"] = a.dir_name;
            j["metadata"] = a.metadata;
        },
        [&](const Renamed& a) {
            j["original"] = a.original;
            j["base_name"] = a.base_name;
            j["metadata"] = a.metadata;
        },
        [&](const Archived& a) {
            j["original"] = a.original;
            j["dir_name"] = a.dir_name;
            j["metadata"] = a.metadata;
        },
        [&](const Modified& a) {
            j["original"] = a.original;
            j["modified"] = a.modified;
            j["size"] = a.size;
            j["digest"] = toHex(a.digest);
        },
    }, action);
}
