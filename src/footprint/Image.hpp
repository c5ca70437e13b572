#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace footprint {

// Minimal image containers and dependency-free readers/writers for the raster path.
//
// Supported inputs:
//  - PPM/PGM binary (P6/P5), maxval <= 65535
//  - PNG: bit depth 1/2/4/8/16, gray, RGB, palette, gray+alpha, RGBA; non-interlaced.
//    Alpha is composited over white so transparent drawing backgrounds read as paper.
//
// Outputs:
//  - PPM (P6) and PNG (RGB8, stored DEFLATE blocks).

struct RgbImage {
  int width = 0;
  int height = 0;

  // Interleaved RGB8, row-major, size = width*height*3.
  std::vector<std::uint8_t> rgb;
};

struct GrayImage {
  int width = 0;
  int height = 0;

  // Row-major luma, size = width*height.
  std::vector<std::uint8_t> pixels;

  std::uint8_t at(int x, int y) const
  {
    return pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
  }
};

bool ReadPpm(const std::string& path, RgbImage& outImg, std::string& outError);
bool WritePpm(const std::string& path, const RgbImage& img, std::string& outError);

// Decode a complete PNG file held in memory.
bool DecodePng(const std::vector<std::uint8_t>& bytes, RgbImage& outImg, std::string& outError);
bool ReadPng(const std::string& path, RgbImage& outImg, std::string& outError);
bool WritePng(const std::string& path, const RgbImage& img, std::string& outError);

// Dispatch on extension (.png, .ppm/.pgm/.pnm), probing the magic bytes otherwise.
bool ReadImageAuto(const std::string& path, RgbImage& outImg, std::string& outError);

// .png writes PNG, anything else writes PPM.
bool WriteImageAuto(const std::string& path, const RgbImage& img, std::string& outError);

// ITU-R BT.601 luma.
GrayImage ToGray(const RgbImage& img);

// Expand a gray image back to RGB (useful as an overlay canvas).
RgbImage GrayToRgb(const GrayImage& img);

// Resample to exactly dstW x dstH by averaging the source pixels each destination pixel
// covers (box filter). Degenerates to nearest-neighbour when enlarging.
GrayImage ResizeGrayArea(const GrayImage& src, int dstW, int dstH);

} // namespace footprint
