#include "spidevio/hex.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace spidevio {

bool parse_hex(const char* str, std::vector<uint8_t>& out) {
    out.clear();
    size_t n = std::strlen(str);
    if (n >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        str += 2;
        n -= 2;
    }
    if (n % 2 != 0) return false;

    for (size_t i = 0; i < n; i += 2) {
        // strtol alone would accept a sign or whitespace
        if (!std::isxdigit(static_cast<unsigned char>(str[i])) ||
            !std::isxdigit(static_cast<unsigned char>(str[i + 1]))) {
            return false;
        }
        char byte[3] = {str[i], str[i + 1], '\0'};
        out.push_back(static_cast<uint8_t>(std::strtol(byte, nullptr, 16)));
    }
    return true;
}

} // namespace spidevio
