#include "snapshot/model/Policy.hpp"

#include <fmt/args.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string_view>

using namespace fsnap::snapshot::model;

namespace {

// Names of the replacement fields, in order of appearance. Stops at an
// unterminated field; fmt reports it when formatting.
std::vector<std::string> fieldNames(const std::string_view format) {
    std::vector<std::string> names;
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '{') continue;
        if (i + 1 < format.size() && format[i + 1] == '{') {
            ++i;
            continue;
        }

        const auto end = format.find_first_of(":}", i + 1);
        if (end == std::string_view::npos) break;
        names.emplace_back(format.substr(i + 1, end - i - 1));

        i = end;
        for (int depth = format[end] == ':' ? 1 : 0; depth > 0 && ++i < format.size();) {
            if (format[i] == '{') ++depth;
            else if (format[i] == '}') --depth;
        }
    }
    return names;
}

}

bool fsnap::snapshot::model::isArchived(const ArchivedBy& policy, const Metadata& metadata) {
    const auto* rule = std::get_if<HasMetadata>(&policy);
    if (!rule) return false;

    const auto it = metadata.find(rule->key);
    if (it == metadata.end()) return false;
    return rule->values.empty() || rule->values.contains(it->second);
}

std::optional<std::string> fsnap::snapshot::model::calculate(const CalcBy& policy, const Metadata& metadata) {
    const auto* rule = std::get_if<FromMetadata>(&policy);
    if (!rule) return std::nullopt;

    const auto names = fieldNames(rule->format);
    if (!std::ranges::all_of(names, [&](const std::string& n) { return metadata.contains(n); }))
        return std::nullopt;

    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& [k, v] : metadata) store.push_back(fmt::arg(k.c_str(), v));
    return fmt::vformat(rule->format, store);
}

void fsnap::snapshot::model::validate(const CalcBy& policy) {
    const auto* rule = std::get_if<FromMetadata>(&policy);
    if (!rule) return;

    const auto names = fieldNames(rule->format);
    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& n : names) {
        if (n.empty() || std::isdigit(static_cast<unsigned char>(n.front())))
            throw fmt::format_error("positional fields are not supported, name every field");
        store.push_back(fmt::arg(n.c_str(), std::string{}));
    }

    (void)fmt::vformat(rule->format, store);
}
