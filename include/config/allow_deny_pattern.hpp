#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace bqlineage {

/**
 * @brief Allow/deny regex filter for dataset and table names
 *
 * A name is allowed when no deny pattern matches and at least one allow
 * pattern matches. Patterns are anchored at the start of the name (prefix
 * match, like regex "match" semantics), not at the end.
 *
 * @throws std::regex_error from the constructor on an invalid pattern
 */
class AllowDenyPattern {
public:
    AllowDenyPattern() : AllowDenyPattern({".*"}, {}, true) {}
    AllowDenyPattern(std::vector<std::string> allow,
                     std::vector<std::string> deny,
                     bool ignore_case = true);

    [[nodiscard]] static AllowDenyPattern allow_all() { return AllowDenyPattern(); }

    [[nodiscard]] bool allowed(std::string_view name) const;

    [[nodiscard]] const std::vector<std::string>& allow_patterns() const { return allow_; }
    [[nodiscard]] const std::vector<std::string>& deny_patterns() const { return deny_; }
    [[nodiscard]] bool ignore_case() const { return ignore_case_; }

private:
    std::vector<std::string> allow_;
    std::vector<std::string> deny_;
    bool ignore_case_;

    // Compiled once
    std::vector<std::regex> allow_re_;
    std::vector<std::regex> deny_re_;
};

} // namespace bqlineage
