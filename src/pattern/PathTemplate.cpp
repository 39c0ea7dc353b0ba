#include "pattern/PathTemplate.hpp"
#include "util/errors.hpp"

#include <fnmatch.h>
#include <locale>
#include <set>
#include <string_view>

using namespace fsnap::pattern;

namespace {

constexpr char SEP = '/';
constexpr std::string_view REGEX_SPECIAL = "\\^$.|?*+()[]{}";
constexpr std::string_view GLOB_SPECIAL = "\\?*[]";

constexpr std::string_view ANY_SEGMENTS = ".+";
constexpr std::string_view ONE_SEGMENT = "[^/]+";

bool isNameChar(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

void appendEscaped(std::string& out, const char c, const std::string_view special) {
    if (special.find(c) != std::string_view::npos) out.push_back('\\');
    out.push_back(c);
}

struct Translation {
    std::string expr, glob;
    std::vector<std::string> variables;
    std::set<std::string> seen;
};

void translateSegment(const std::string& pattern, const std::string_view segment, Translation& t) {
    for (size_t i = 0; i < segment.size(); ++i) {
        const char c = segment[i];

        if (c == '*') {
            if (i + 1 < segment.size() && segment[i + 1] == '*') {
                t.expr += ANY_SEGMENTS;
                ++i;
            } else t.expr += ONE_SEGMENT;
            t.glob.push_back('*');
            continue;
        }

        if (c == '{') {
            const auto close = segment.find('}', i + 1);
            if (close == std::string_view::npos)
                throw fsnap::PatternError("Unbalanced '{' in path pattern: " + pattern);

            const auto name = std::string(segment.substr(i + 1, close - i - 1));
            if (name.empty())
                throw fsnap::PatternError("Empty variable name in path pattern: " + pattern);
            for (const char n : name)
                if (!isNameChar(n))
                    throw fsnap::PatternError("Invalid variable name '" + name + "' in path pattern: " + pattern);
            if (!t.seen.insert(name).second)
                throw fsnap::PatternError("Duplicate variable '" + name + "' in path pattern: " + pattern);

            t.variables.push_back(name);
            t.expr += "(";
            t.expr += ONE_SEGMENT;
            t.expr += ")";
            t.glob.push_back('*');
            i = close;
            continue;
        }

        if (c == '}') throw fsnap::PatternError("Unbalanced '}' in path pattern: " + pattern);

        appendEscaped(t.expr, c, REGEX_SPECIAL);
        appendEscaped(t.glob, c, GLOB_SPECIAL);
    }
}

}

Matcher::Matcher(const std::string& expr, std::vector<std::string> variables)
    : expr_(expr), variables_(std::move(variables)) {
    re_.imbue(std::locale::classic());
    try {
        re_.assign(expr_, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw PatternError("Failed to compile path expression '" + expr_ + "': " + e.what());
    }
}

std::optional<Captures> Matcher::match(const std::string& path) const {
    std::smatch m;
    if (!std::regex_match(path, m, re_)) return std::nullopt;

    Captures captures;
    for (size_t i = 0; i < variables_.size(); ++i) captures[variables_[i]] = m[i + 1].str();
    return captures;
}

bool PathTemplate::globMatches(const std::string& path) const {
    return ::fnmatch(glob.c_str(), path.c_str(), FNM_CASEFOLD) == 0;
}

std::optional<Captures> PathTemplate::match(const std::string& path) const {
    if (!globMatches(path)) return std::nullopt;
    return matcher.match(path);
}

PathTemplate fsnap::pattern::compile(const std::string& pattern) {
    if (pattern.empty()) throw PatternError("Path pattern is empty");
    if (pattern.front() == SEP) throw PatternError("Path pattern must be relative to the root directory: " + pattern);

    Translation t;
    std::string_view rest(pattern);
    bool first = true;
    while (true) {
        const auto pos = rest.find(SEP);
        const auto segment = rest.substr(0, pos);
        if (segment.empty()) throw PatternError("Empty segment in path pattern: " + pattern);

        if (!first) {
            t.expr.push_back(SEP);
            t.glob.push_back(SEP);
        }
        translateSegment(pattern, segment, t);
        first = false;

        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }

    return PathTemplate{
        .source = pattern,
        .glob = t.glob,
        .matcher = Matcher(t.expr, std::move(t.variables)),
    };
}
