#include "filter_set.hpp"

namespace pg {

std::expected<FilterSet, std::string> FilterSet::parse(const std::string& filter) {
    FilterSet set;
    if (filter.empty()) {
        return set;
    }

    size_t start = 0;
    while (true) {
        size_t end = filter.find(kSeparator, start);
        std::string source = filter.substr(start, end == std::string::npos ? std::string::npos
                                                                           : end - start);
        try {
            set.patterns_.emplace_back(source, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return std::unexpected("Invalid filter pattern '" + source + "': " + e.what());
        }
        set.sources_.push_back(std::move(source));

        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return set;
}

bool FilterSet::matches(size_t index, const std::string& name) const {
    return std::regex_search(name, patterns_[index]);
}

bool FilterSet::matches_any(const std::string& name) const {
    for (size_t i = 0; i < patterns_.size(); ++i) {
        if (matches(i, name)) {
            return true;
        }
    }
    return false;
}

} // namespace pg
