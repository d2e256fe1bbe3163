#include "analysis/NameMatcher.h"
#include <algorithm>
#include <cctype>
#include <vector>

NameMatcher::NameMatcher(const std::string& pattern)
    : original(pattern), lowered(toLower(pattern)) {}

std::string NameMatcher::toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool NameMatcher::isSubsequence(const std::string& needle, const std::string& haystack) {
    size_t i = 0;
    for (char c : haystack) {
        if (i < needle.size() && needle[i] == c) ++i;
    }
    return i == needle.size();
}

int NameMatcher::levenshtein(const std::string& a, const std::string& b) {
    std::vector<int> prev(b.size() + 1);
    std::vector<int> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            int cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

bool NameMatcher::matches(const std::string& name) const {
    if (lowered.empty()) return false;
    std::string lowerName = toLower(name);
    if (lowerName.find(lowered) != std::string::npos) return true;
    return isSubsequence(lowered, lowerName);
}

bool NameMatcher::isExactMatch(const std::string& name) const {
    return toLower(name) == lowered;
}

int NameMatcher::distance(const std::string& name) const {
    return levenshtein(lowered, toLower(name));
}
