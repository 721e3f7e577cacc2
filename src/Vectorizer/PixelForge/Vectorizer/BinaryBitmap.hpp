/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <PixelForge/Imaging/PixelBuffer.hpp>

namespace PixelForge::Vectorizer {

/**
 * @class BinaryBitmap
 * @brief One byte per pixel, 1 for ink and 0 for background. Immutable once built.
 */
class BinaryBitmap {
public:
	/**
	 * @brief Thresholds a pixel buffer.
	 *
	 * A pixel is ink when its alpha is at least 128 and its luminance
	 * (0.299R + 0.587G + 0.114B) does not exceed the threshold.
	 */
	static BinaryBitmap fromPixels(const Imaging::PixelBuffer &pixels, std::uint8_t threshold);

	BinaryBitmap(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bits);

	std::uint32_t getWidth() const noexcept { return width_; }
	std::uint32_t getHeight() const noexcept { return height_; }

	bool isInk(std::int64_t x, std::int64_t y) const noexcept
	{
		if (x < 0 || y < 0 || x >= static_cast<std::int64_t>(width_) || y >= static_cast<std::int64_t>(height_)) {
			return false;
		}
		return bits_[static_cast<std::size_t>(y) * width_ + static_cast<std::size_t>(x)] != 0;
	}

	/**
	 * @brief True for an ink pixel with at least one 4-neighbour that is background or off-image.
	 */
	bool isBoundary(std::int64_t x, std::int64_t y) const noexcept
	{
		return isInk(x, y) && (!isInk(x + 1, y) || !isInk(x - 1, y) || !isInk(x, y + 1) || !isInk(x, y - 1));
	}

	std::size_t countInk() const noexcept;

private:
	std::uint32_t width_;
	std::uint32_t height_;
	std::vector<std::uint8_t> bits_;
};

} // namespace PixelForge::Vectorizer
