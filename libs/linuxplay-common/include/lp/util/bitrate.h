///////////////////////////////////////////////////////////////////////////////
// bitrate.h -- Bitrate string helpers shared by host and viewer
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <string>

namespace lp {

/// "8M" -> 8000000, "1.5k" -> 1500, "1G", plain numbers.  Case-insensitive.
/// Empty or malformed input returns 0.
uint64_t parseBitrateBits(const std::string& text);

/// Inverse of parseBitrateBits() rounded down to whole k/M units:
/// 1000000 -> "1M", 1500 -> "1k", values below 1000 print as-is (minimum 1).
std::string formatBits(uint64_t bits);

/// Bits per pixel needed for acceptable quality with the given codec name
/// ("h.264", "h.265", "hevc").  High frame rates get a small bonus.
double targetBitsPerPixel(const std::string& codec, uint32_t fps);

/// Smallest bitrate that keeps a width x height @ fps stream watchable.
uint64_t minimumSafeBitrate(const std::string& codec, uint32_t width,
                            uint32_t height, uint32_t fps);

} // namespace lp
