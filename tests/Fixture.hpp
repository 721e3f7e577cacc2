/*
 * PixelForge
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>

#include <PixelForge/Imaging/Color.hpp>
#include <PixelForge/Imaging/PixelBuffer.hpp>

namespace Fixture {

using PixelForge::Imaging::PixelBuffer;
using PixelForge::Imaging::Rgba;

constexpr Rgba RED = {255, 0, 0, 255};
constexpr Rgba GREEN = {0, 255, 0, 255};
constexpr Rgba BLUE = {0, 0, 255, 255};
constexpr Rgba WHITE = {255, 255, 255, 255};
constexpr Rgba BLACK = {0, 0, 0, 255};
constexpr Rgba GRAY = {128, 128, 128, 255};
constexpr Rgba NEAR_WHITE = {250, 252, 248, 255};
constexpr Rgba CLEAR = {0, 0, 0, 0};

/**
 * @brief A width x height canvas of `background` with a filled rectangle of `ink`.
 */
inline PixelBuffer makeRectangleImage(std::uint32_t width, std::uint32_t height, std::uint32_t rectX,
				      std::uint32_t rectY, std::uint32_t rectW, std::uint32_t rectH, Rgba ink = BLACK,
				      Rgba background = WHITE)
{
	PixelBuffer buffer(width, height, background);
	buffer.fillRect(rectX, rectY, rectW, rectH, ink);
	return buffer;
}

} // namespace Fixture
