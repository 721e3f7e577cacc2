/*
 * PixelForge Imaging Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace PixelForge::Imaging {

struct Rgb {
	std::uint8_t r;
	std::uint8_t g;
	std::uint8_t b;

	bool operator==(const Rgb &) const = default;
};

struct Rgba {
	std::uint8_t r;
	std::uint8_t g;
	std::uint8_t b;
	std::uint8_t a;

	bool operator==(const Rgba &) const = default;
};

/**
 * @brief Hue in degrees [0, 360), saturation and lightness in [0, 1].
 */
struct Hsl {
	double h;
	double s;
	double l;
};

constexpr Rgb kWhite = {255, 255, 255};
constexpr Rgb kBlack = {0, 0, 0};

Hsl rgbToHsl(Rgb color) noexcept;

/**
 * @brief Rec. 601 luma, 0.299R + 0.587G + 0.114B, in [0, 255].
 */
constexpr double luminance(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept
{
	return 0.299 * r + 0.587 * g + 0.114 * b;
}

/**
 * @brief Shortest distance between two hues on the colour wheel, in degrees.
 */
double hueDistance(double a, double b) noexcept;

/**
 * @brief Parses "#rgb", "#rrggbb", "rgb(r, g, b)" or a basic colour name.
 * @throws std::invalid_argument if the text is not a recognised colour.
 */
Rgb parseColor(std::string_view text);

/**
 * @brief Formats a colour as lowercase "#rrggbb".
 */
std::string toHexString(Rgb color);

} // namespace PixelForge::Imaging
