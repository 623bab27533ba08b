#pragma once

#include <expected>
#include <regex>
#include <string>
#include <vector>

namespace pg {

// Ordered list of name patterns parsed from a backtick-separated string,
// e.g. "HK`JP|Tokyo". Declaration order decides output order.
class FilterSet {
public:
    static constexpr char kSeparator = '`';

    FilterSet() = default;

    // An empty string yields an empty set (no filtering)
    static std::expected<FilterSet, std::string> parse(const std::string& filter);

    bool empty() const { return patterns_.empty(); }
    size_t size() const { return patterns_.size(); }

    // True if pattern `index` occurs anywhere in name
    bool matches(size_t index, const std::string& name) const;

    // True if any pattern matches
    bool matches_any(const std::string& name) const;

    const std::vector<std::string>& sources() const { return sources_; }

private:
    std::vector<std::regex> patterns_;
    std::vector<std::string> sources_;
};

} // namespace pg
