#include "resolve/WildcardMatcher.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/join.hpp>

namespace ferry::resolve {

WildcardMatcher::WildcardMatcher(std::string expression)
    : expression_(std::move(expression)),
      regex_(expression_, std::regex::ECMAScript | std::regex::icase | std::regex::optimize) {}

std::string WildcardMatcher::toRegex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2 + 2);
    out += '^';

    for (const char c : glob) {
        switch (c) {
            case '*': out += ".*"; break;
            case '?': out += '.'; break;
            case '\\': case '^': case '$': case '.': case '|': case '+':
            case '(': case ')': case '[': case ']': case '{': case '}':
                out += '\\';
                out += c;
                break;
            default: out += c;
        }
    }

    out += '$';
    return out;
}

WildcardMatcher WildcardMatcher::compile(const std::vector<std::string>& patterns) {
    if (patterns.empty()) return WildcardMatcher("^.*$");

    std::vector<std::string> alternatives;
    alternatives.reserve(patterns.size());
    for (const auto& p : patterns) alternatives.push_back("(?:" + toRegex(p) + ")");

    auto expr = boost::algorithm::join(alternatives, "|");
    log::Registry::resolve()->debug("[WildcardMatcher] Compiled {} pattern(s) to {}", patterns.size(), expr);
    return WildcardMatcher(std::move(expr));
}

bool WildcardMatcher::isMatch(const std::string& name) const {
    return std::regex_match(name, regex_);
}

}
