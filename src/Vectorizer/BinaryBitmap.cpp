/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Vectorizer/BinaryBitmap.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include <PixelForge/Imaging/Color.hpp>

namespace PixelForge::Vectorizer {

namespace {

constexpr std::uint8_t kOpaqueAlphaMin = 128;

} // anonymous namespace

BinaryBitmap BinaryBitmap::fromPixels(const Imaging::PixelBuffer &pixels, std::uint8_t threshold)
{
	std::vector<std::uint8_t> bits(pixels.getPixelCount(), 0);

	const auto samples = pixels.samples();
	for (std::size_t i = 0; i < bits.size(); ++i) {
		const std::uint8_t *p = samples.data() + i * Imaging::PixelBuffer::kChannels;
		const double gray = Imaging::luminance(p[0], p[1], p[2]);
		bits[i] = (p[3] >= kOpaqueAlphaMin && gray <= threshold) ? 1 : 0;
	}

	return BinaryBitmap(pixels.getWidth(), pixels.getHeight(), std::move(bits));
}

BinaryBitmap::BinaryBitmap(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> bits)
	: width_(width),
	  height_(height),
	  bits_(std::move(bits))
{
	if (bits_.size() != static_cast<std::size_t>(width) * height) {
		throw std::invalid_argument(
			fmt::format("BitCountMismatch(BinaryBitmap::BinaryBitmap): expected {} for {}x{}, got {}",
				    static_cast<std::size_t>(width) * height, width, height, bits_.size()));
	}
}

std::size_t BinaryBitmap::countInk() const noexcept
{
	return static_cast<std::size_t>(std::count_if(bits_.begin(), bits_.end(), [](std::uint8_t b) { return b != 0; }));
}

} // namespace PixelForge::Vectorizer
