#include "scanner/glob.hpp"

#include <algorithm>

namespace packager::scanner {

bool MatchesGlob(std::string_view name, std::string_view pattern) {
    size_t n = 0;
    size_t p = 0;
    size_t star      = std::string_view::npos;  // Позиция последней '*' в шаблоне.
    size_t star_name = 0;                       // Сколько символов имени она поглотила.

    while(n < name.size()) {
        if(p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++n;
            ++p;
        }
        else if(p < pattern.size() && pattern[p] == '*') {
            star      = p++;
            star_name = n;
        }
        else if(star != std::string_view::npos) {
            // Откатываемся: последняя '*' забирает еще один символ.
            p = star + 1;
            n = ++star_name;
        }
        else {
            return false;
        }
    }
    while(p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool MatchesAny(std::string_view name, const std::vector<std::string>& patterns) {
    return std::ranges::any_of(patterns, [&](const std::string& pattern) { return MatchesGlob(name, pattern); });
}

}  // namespace packager::scanner
