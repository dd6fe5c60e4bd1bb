#pragma once

#include <string>
#include <vector>

namespace camsnitch::detect {

// Expands a device-path glob such as `/dev/video*`.
//
// Contract:
// - returns `true` on a successful expansion, including zero matches
// - returns `false` only when the expansion itself fails (empty pattern,
//   out of memory, unreadable directory)
// - paths are ordered by trailing numeric index (`video2` before `video10`),
//   falling back to lexical order
bool ExpandDevicePattern(const std::string& pattern, std::vector<std::string>& paths,
                         std::string& error);

} // namespace camsnitch::detect
