#pragma once
#include <string>

/**
 * @brief Case-insensitive fuzzy name matching used by symbol search.
 *
 * A name matches a pattern when the lower-cased pattern is a substring of the
 * lower-cased name, or when its characters appear in the name in order.
 */
class NameMatcher {
public:
    explicit NameMatcher(const std::string& pattern);

    bool matches(const std::string& name) const;
    bool isExactMatch(const std::string& name) const;
    // Edit distance between the lower-cased pattern and name.
    int distance(const std::string& name) const;

    const std::string& pattern() const { return original; }

    static std::string toLower(const std::string& s);
    static bool isSubsequence(const std::string& needle, const std::string& haystack);
    static int levenshtein(const std::string& a, const std::string& b);

private:
    std::string original;
    std::string lowered;
};
