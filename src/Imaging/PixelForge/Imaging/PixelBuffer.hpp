/*
 * PixelForge Imaging Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "Color.hpp"

namespace PixelForge::Imaging {

/**
 * @class PixelBuffer
 * @brief Interleaved RGBA8 image, row-major and top-to-bottom.
 *
 * The sample array always holds exactly width * height * 4 bytes. A 0x0 buffer can
 * exist but is rejected by every processing operation through requireNonEmpty().
 */
class PixelBuffer {
public:
	static constexpr std::size_t kChannels = 4;

	PixelBuffer() noexcept = default;

	/**
	 * @brief Creates a buffer of the given size filled with a single colour.
	 */
	PixelBuffer(std::uint32_t width, std::uint32_t height, Rgba fill = {0, 0, 0, 0});

	/**
	 * @brief Adopts an existing sample array.
	 * @throws std::invalid_argument if samples.size() != width * height * 4.
	 */
	PixelBuffer(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> samples);

	std::uint32_t getWidth() const noexcept { return width_; }
	std::uint32_t getHeight() const noexcept { return height_; }
	std::size_t getPixelCount() const noexcept { return static_cast<std::size_t>(width_) * height_; }
	bool empty() const noexcept { return width_ == 0 || height_ == 0; }

	std::span<std::uint8_t> samples() noexcept { return samples_; }
	std::span<const std::uint8_t> samples() const noexcept { return samples_; }

	bool contains(std::int64_t x, std::int64_t y) const noexcept
	{
		return x >= 0 && y >= 0 && x < static_cast<std::int64_t>(width_) &&
		       y < static_cast<std::int64_t>(height_);
	}

	std::size_t offsetOf(std::uint32_t x, std::uint32_t y) const noexcept
	{
		return (static_cast<std::size_t>(y) * width_ + x) * kChannels;
	}

	Rgba at(std::uint32_t x, std::uint32_t y) const noexcept
	{
		const std::uint8_t *p = samples_.data() + offsetOf(x, y);
		return {p[0], p[1], p[2], p[3]};
	}

	void set(std::uint32_t x, std::uint32_t y, Rgba color) noexcept
	{
		std::uint8_t *p = samples_.data() + offsetOf(x, y);
		p[0] = color.r;
		p[1] = color.g;
		p[2] = color.b;
		p[3] = color.a;
	}

	void setAlpha(std::uint32_t x, std::uint32_t y, std::uint8_t alpha) noexcept
	{
		samples_[offsetOf(x, y) + 3] = alpha;
	}

	/**
	 * @brief Fills the rectangle [x, x + w) x [y, y + h), clipped to the buffer.
	 */
	void fillRect(std::uint32_t x, std::uint32_t y, std::uint32_t w, std::uint32_t h, Rgba color) noexcept;

	/**
	 * @throws std::invalid_argument naming the calling operation if the buffer is empty.
	 */
	void requireNonEmpty(std::string_view operation) const;

	bool operator==(const PixelBuffer &) const = default;

private:
	std::uint32_t width_ = 0;
	std::uint32_t height_ = 0;
	std::vector<std::uint8_t> samples_;
};

} // namespace PixelForge::Imaging
