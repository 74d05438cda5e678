#pragma once

#include <regex>
#include <string>
#include <vector>

namespace ferry::resolve {

// Filename globs ("*", "?") folded into one anchored, case-insensitive regex
// compiled once. An empty pattern list matches everything.
class WildcardMatcher {
public:
    static WildcardMatcher compile(const std::vector<std::string>& patterns);

    [[nodiscard]] bool isMatch(const std::string& name) const;

    [[nodiscard]] const std::string& expression() const { return expression_; }

    // "*.pdf" -> "^.*\.pdf$"
    static std::string toRegex(const std::string& glob);

private:
    explicit WildcardMatcher(std::string expression);

    std::string expression_;
    std::regex regex_;
};

}
