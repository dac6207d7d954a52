#pragma once

#include "types.hpp"

#include <string>

/**
 * Decode an image file into interleaved RGB. Returns false (and leaves
 * `out` empty) if the file cannot be read or decoded.
 */
bool LoadRgbImage(const std::string& path, RgbImage& out);
