///////////////////////////////////////////////////////////////////////////////
// bitrate.cpp -- Bitrate string helpers
///////////////////////////////////////////////////////////////////////////////

#include "lp/util/bitrate.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace lp {

uint64_t parseBitrateBits(const std::string& text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (s.empty()) return 0;

    double multiplier = 1.0;
    switch (s.back()) {
        case 'k': multiplier = 1e3; s.pop_back(); break;
        case 'm': multiplier = 1e6; s.pop_back(); break;
        case 'g': multiplier = 1e9; s.pop_back(); break;
        default: break;
    }
    if (s.empty()) return 0;

    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(value) || value < 0.0) return 0;

    return static_cast<uint64_t>(value * multiplier);
}

std::string formatBits(uint64_t bits) {
    if (bits >= 1'000'000) return std::to_string(bits / 1'000'000) + "M";
    if (bits >= 1'000)     return std::to_string(bits / 1'000) + "k";
    return std::to_string(std::max<uint64_t>(1, bits));
}

double targetBitsPerPixel(const std::string& codec, uint32_t fps) {
    std::string c;
    for (char ch : codec) c += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    double bpp = (c == "h.265" || c == "hevc") ? 0.045 : 0.07;
    if (fps >= 90) bpp += 0.02;
    return bpp;
}

uint64_t minimumSafeBitrate(const std::string& codec, uint32_t width,
                            uint32_t height, uint32_t fps) {
    const uint32_t f = std::max<uint32_t>(1, fps);
    return static_cast<uint64_t>(static_cast<double>(width) * height * f *
                                 targetBitsPerPixel(codec, f));
}

} // namespace lp
