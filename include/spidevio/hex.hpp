#pragma once

#include <cstdint>
#include <vector>

namespace spidevio {

// Parse a hex byte string such as "9f0000" or "0x9F0000" into `out`.
// Returns false on an odd digit count or any non-hex character.
bool parse_hex(const char* str, std::vector<uint8_t>& out);

} // namespace spidevio
