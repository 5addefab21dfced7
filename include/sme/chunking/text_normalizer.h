#pragma once

#include <string>
#include <string_view>

namespace sme::chunking {

// Lower-case ASCII letters, collapse whitespace runs to one space, trim both ends
std::string normalizeText(std::string_view text);

// Whitespace-trimmed view of `text`
std::string_view trimView(std::string_view text);

bool isBlank(std::string_view text);

} // namespace sme::chunking
