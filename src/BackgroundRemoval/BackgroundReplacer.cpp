/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/BackgroundRemoval/BackgroundReplacer.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace PixelForge::BackgroundRemoval {

using Imaging::PixelBuffer;

namespace {

inline std::uint8_t toByte(double value) noexcept
{
	if (value <= 0.0)
		return 0;
	if (value >= 255.0)
		return 255;
	return static_cast<std::uint8_t>(std::lround(value));
}

/**
 * Straight-alpha source-over: the foreground sample at fg is blended onto the
 * background sample (bgR, bgG, bgB, bgA) and written back to fg.
 */
inline void compositeOver(std::uint8_t *fg, std::uint8_t bgR, std::uint8_t bgG, std::uint8_t bgB,
			  std::uint8_t bgA) noexcept
{
	const double srcAlpha = fg[3] / 255.0;
	const double dstAlpha = bgA / 255.0;
	const double outAlpha = srcAlpha + dstAlpha * (1.0 - srcAlpha);

	if (outAlpha <= 0.0) {
		fg[0] = fg[1] = fg[2] = fg[3] = 0;
		return;
	}

	const double dstWeight = dstAlpha * (1.0 - srcAlpha);
	fg[0] = toByte((fg[0] * srcAlpha + bgR * dstWeight) / outAlpha);
	fg[1] = toByte((fg[1] * srcAlpha + bgG * dstWeight) / outAlpha);
	fg[2] = toByte((fg[2] * srcAlpha + bgB * dstWeight) / outAlpha);
	fg[3] = toByte(outAlpha * 255.0);
}

} // anonymous namespace

PixelBuffer &replaceBackground(PixelBuffer &foreground, Imaging::Rgb color)
{
	foreground.requireNonEmpty("replaceBackground");

	auto samples = foreground.samples();
	for (std::size_t i = 0; i < samples.size(); i += PixelBuffer::kChannels) {
		compositeOver(&samples[i], color.r, color.g, color.b, 255);
	}
	return foreground;
}

PixelBuffer &replaceBackground(PixelBuffer &foreground, const PixelBuffer &background)
{
	foreground.requireNonEmpty("replaceBackground");
	background.requireNonEmpty("replaceBackground");

	if (foreground.getWidth() != background.getWidth() || foreground.getHeight() != background.getHeight()) {
		throw std::invalid_argument(fmt::format(
			"DimensionMismatch(replaceBackground): foreground is {}x{}, background is {}x{}",
			foreground.getWidth(), foreground.getHeight(), background.getWidth(), background.getHeight()));
	}

	auto samples = foreground.samples();
	auto bg = background.samples();
	for (std::size_t i = 0; i < samples.size(); i += PixelBuffer::kChannels) {
		compositeOver(&samples[i], bg[i], bg[i + 1], bg[i + 2], bg[i + 3]);
	}
	return foreground;
}

} // namespace PixelForge::BackgroundRemoval
