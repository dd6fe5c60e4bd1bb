#pragma once

#include <string_view>

namespace camsnitch {

// Reported by `camsnitch version` and published as the discovery
// descriptor's `device.sw_version`.
inline constexpr std::string_view kVersion = "0.1.0";

} // namespace camsnitch
