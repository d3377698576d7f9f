#pragma once

#include "core/atlas_canvas.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bitatlas
{
enum class Packing : std::uint8_t
{
    Alpha1 = 0, // 1 bit per pixel, MSB first
    Rgba8,      // 4 bytes per pixel, premultiplied white
};

const char* PackingName(Packing p);
bool ParsePacking(std::string_view s, Packing& out);

// Payload size in bytes for a width x height canvas.
std::size_t PackedSize(Packing p, int width, int height);

// Bit (7 - i%8) of byte i/8 is set iff pixel i = y*width + x is non-transparent.
// Width and height must both be multiples of 8.
bool PackAlpha1(const AtlasCanvas& canvas, std::vector<std::uint8_t>& out, std::string& err);

// R, G, B, A per pixel. Each channel is the 16-bit premultiplied sample shifted right by 8.
bool PackRgba8(const AtlasCanvas& canvas, std::vector<std::uint8_t>& out, std::string& err);

bool PackCanvas(Packing p, const AtlasCanvas& canvas, std::vector<std::uint8_t>& out, std::string& err);

// Inverse of PackAlpha1: `out_mask` is row-major, 1 for opaque pixels.
bool UnpackAlpha1(const std::vector<std::uint8_t>& bytes,
                  int width,
                  int height,
                  std::vector<std::uint8_t>& out_mask,
                  std::string& err);

// Reduces an RGBA8 payload to the same opaque mask (alpha channel != 0).
bool UnpackRgba8(const std::vector<std::uint8_t>& bytes,
                 int width,
                 int height,
                 std::vector<std::uint8_t>& out_mask,
                 std::string& err);
} // namespace bitatlas
