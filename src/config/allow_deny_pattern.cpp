#include "config/allow_deny_pattern.hpp"

namespace bqlineage {

namespace {

std::vector<std::regex> compile_all(const std::vector<std::string>& patterns, bool ignore_case) {
    auto flags = std::regex::ECMAScript;
    if (ignore_case) flags |= std::regex::icase;

    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto& p : patterns) {
        compiled.emplace_back(p, flags);
    }
    return compiled;
}

bool matches_prefix(const std::regex& re, std::string_view name) {
    return std::regex_search(name.begin(), name.end(), re,
                             std::regex_constants::match_continuous);
}

} // anonymous namespace

AllowDenyPattern::AllowDenyPattern(std::vector<std::string> allow,
                                   std::vector<std::string> deny,
                                   bool ignore_case)
    : allow_(std::move(allow)),
      deny_(std::move(deny)),
      ignore_case_(ignore_case),
      allow_re_(compile_all(allow_, ignore_case_)),
      deny_re_(compile_all(deny_, ignore_case_)) {}

bool AllowDenyPattern::allowed(std::string_view name) const {
    for (const auto& re : deny_re_) {
        if (matches_prefix(re, name)) return false;
    }
    for (const auto& re : allow_re_) {
        if (matches_prefix(re, name)) return true;
    }
    return false;
}

} // namespace bqlineage
