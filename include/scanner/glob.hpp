#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace packager::scanner {

// Поддерживаются только '*' и '?', сравнение регистрозависимое.
bool MatchesGlob(std::string_view name, std::string_view pattern);

bool MatchesAny(std::string_view name, const std::vector<std::string>& patterns);

}  // namespace packager::scanner
