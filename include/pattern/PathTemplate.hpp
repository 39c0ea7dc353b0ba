#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fsnap::pattern {

using Captures = std::map<std::string, std::string>;

// Anchored, case-insensitive matcher produced by compile(). Capture group i+1
// binds variables()[i].
class Matcher {
public:
    Matcher(const std::string& expr, std::vector<std::string> variables);

    [[nodiscard]] std::optional<Captures> match(const std::string& path) const;

    [[nodiscard]] const std::string& expression() const { return expr_; }
    [[nodiscard]] const std::vector<std::string>& variables() const { return variables_; }

private:
    std::string expr_;
    std::regex re_;
    std::vector<std::string> variables_;
};

struct PathTemplate {
    std::string source;
    std::string glob;   // fnmatch(3) pattern, always a superset of what matcher accepts
    Matcher matcher;

    [[nodiscard]] bool globMatches(const std::string& path) const;

    // glob prefilter first, then the precise matcher
    [[nodiscard]] std::optional<Captures> match(const std::string& path) const;
};

// Patterns are relative, '/'-separated. Tokens: "*" one segment, "**" one or
// more segments, "{name}" one segment bound to name. Throws PatternError.
[[nodiscard]] PathTemplate compile(const std::string& pattern);

}
