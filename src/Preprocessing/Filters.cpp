/*
 * PixelForge Preprocessing Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Preprocessing/Filters.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

namespace PixelForge::Preprocessing {

namespace {

using Imaging::PixelBuffer;

std::uint8_t clampToByte(double value) noexcept
{
	return static_cast<std::uint8_t>(std::nearbyint(std::clamp(value, 0.0, 255.0)));
}

template<typename Fn> void mapRgb(PixelBuffer &buffer, Fn &&fn)
{
	const auto samples = buffer.samples();
	for (std::size_t i = 0; i < samples.size(); i += PixelBuffer::kChannels) {
		samples[i + 0] = clampToByte(fn(samples[i + 0]));
		samples[i + 1] = clampToByte(fn(samples[i + 1]));
		samples[i + 2] = clampToByte(fn(samples[i + 2]));
	}
}

void checkBlurRadius(double radius)
{
	if (!(radius >= 0.0)) {
		throw std::invalid_argument(fmt::format("InvalidBlurRadius(boxBlur): {}", radius));
	}
}

void checkContrast(double contrast)
{
	if (!(contrast >= -255.0 && contrast <= 255.0)) {
		throw std::invalid_argument(fmt::format("InvalidContrast(adjustContrast): {}", contrast));
	}
}

void checkBrightness(double brightness)
{
	if (!std::isfinite(brightness)) {
		throw std::invalid_argument(fmt::format("InvalidBrightness(adjustBrightness): {}", brightness));
	}
}

} // anonymous namespace

PixelBuffer &boxBlur(PixelBuffer &buffer, double radius)
{
	checkBlurRadius(radius);
	buffer.requireNonEmpty("boxBlur");

	const std::int64_t half = static_cast<std::int64_t>(std::floor(radius));
	if (half == 0)
		return buffer;

	const std::int64_t width = buffer.getWidth();
	const std::int64_t height = buffer.getHeight();
	const auto target = buffer.samples();
	const std::vector<std::uint8_t> source(target.begin(), target.end());

	for (std::int64_t y = 0; y < height; ++y) {
		for (std::int64_t x = 0; x < width; ++x) {
			std::array<std::uint64_t, PixelBuffer::kChannels> sums{};
			std::uint64_t count = 0;

			const std::int64_t y0 = std::max<std::int64_t>(0, y - half);
			const std::int64_t y1 = std::min(height - 1, y + half);
			const std::int64_t x0 = std::max<std::int64_t>(0, x - half);
			const std::int64_t x1 = std::min(width - 1, x + half);

			for (std::int64_t ky = y0; ky <= y1; ++ky) {
				for (std::int64_t kx = x0; kx <= x1; ++kx) {
					const std::size_t offset = static_cast<std::size_t>(ky * width + kx) * PixelBuffer::kChannels;
					for (std::size_t c = 0; c < PixelBuffer::kChannels; ++c) {
						sums[c] += source[offset + c];
					}
					++count;
				}
			}

			const std::size_t offset = static_cast<std::size_t>(y * width + x) * PixelBuffer::kChannels;
			for (std::size_t c = 0; c < PixelBuffer::kChannels; ++c) {
				target[offset + c] = clampToByte(static_cast<double>(sums[c]) / static_cast<double>(count));
			}
		}
	}

	return buffer;
}

PixelBuffer &adjustContrast(PixelBuffer &buffer, double contrast)
{
	checkContrast(contrast);
	buffer.requireNonEmpty("adjustContrast");

	const double factor = (259.0 * (contrast + 255.0)) / (255.0 * (259.0 - contrast));
	mapRgb(buffer, [factor](std::uint8_t v) { return factor * (static_cast<double>(v) - 128.0) + 128.0; });
	return buffer;
}

PixelBuffer &adjustBrightness(PixelBuffer &buffer, double brightness)
{
	checkBrightness(brightness);
	buffer.requireNonEmpty("adjustBrightness");

	mapRgb(buffer, [brightness](std::uint8_t v) { return static_cast<double>(v) + brightness; });
	return buffer;
}

PixelBuffer &applyPreprocessing(PixelBuffer &buffer, const PreprocessOptions &options)
{
	// Every setting is checked up front so a bad one never leaves the buffer half filtered.
	checkBlurRadius(options.blur);
	checkContrast(options.contrast);
	checkBrightness(options.brightness);
	buffer.requireNonEmpty("applyPreprocessing");

	if (options.blur != 0.0)
		boxBlur(buffer, options.blur);
	if (options.contrast != 0.0)
		adjustContrast(buffer, options.contrast);
	if (options.brightness != 0.0)
		adjustBrightness(buffer, options.brightness);
	return buffer;
}

} // namespace PixelForge::Preprocessing
