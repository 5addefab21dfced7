#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to fmt library

#if defined(SME_HAS_STD_FORMAT) && SME_HAS_STD_FORMAT
#include <format>
namespace sme {
using std::format;
using std::format_to;
using std::vformat;
} // namespace sme
#else
#include <spdlog/fmt/fmt.h>

namespace sme {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace sme
#endif
