/*
 * PixelForge Imaging Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Imaging/PixelBuffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace PixelForge::Imaging {

PixelBuffer::PixelBuffer(std::uint32_t width, std::uint32_t height, Rgba fill)
	: width_(width),
	  height_(height),
	  samples_(static_cast<std::size_t>(width) * height * kChannels)
{
	for (std::size_t i = 0; i < samples_.size(); i += kChannels) {
		samples_[i + 0] = fill.r;
		samples_[i + 1] = fill.g;
		samples_[i + 2] = fill.b;
		samples_[i + 3] = fill.a;
	}
}

PixelBuffer::PixelBuffer(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> samples)
	: width_(width),
	  height_(height),
	  samples_(std::move(samples))
{
	const std::size_t expected = static_cast<std::size_t>(width) * height * kChannels;
	if (samples_.size() != expected) {
		throw std::invalid_argument(fmt::format(
			"SampleCountMismatch(PixelBuffer::PixelBuffer): expected {} bytes for {}x{} RGBA, got {}",
			expected, width, height, samples_.size()));
	}
}

void PixelBuffer::fillRect(std::uint32_t x, std::uint32_t y, std::uint32_t w, std::uint32_t h, Rgba color) noexcept
{
	const std::uint32_t x1 = std::min<std::uint64_t>(static_cast<std::uint64_t>(x) + w, width_);
	const std::uint32_t y1 = std::min<std::uint64_t>(static_cast<std::uint64_t>(y) + h, height_);

	for (std::uint32_t yy = y; yy < y1; ++yy) {
		for (std::uint32_t xx = x; xx < x1; ++xx) {
			set(xx, yy, color);
		}
	}
}

void PixelBuffer::requireNonEmpty(std::string_view operation) const
{
	if (empty()) {
		throw std::invalid_argument(
			fmt::format("EmptyPixelBuffer({}): {}x{} buffer has no pixels", operation, width_, height_));
	}
}

} // namespace PixelForge::Imaging
