/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/BackgroundRemoval/ColorClassifiers.hpp"

#include <cmath>
#include <cstdlib>

namespace PixelForge::BackgroundRemoval {

using Imaging::PixelBuffer;

bool ColorMatchClassifier::matches(std::uint8_t r, std::uint8_t g, std::uint8_t b) const noexcept
{
	return std::abs(r - targetColor_.r) < tolerance_ && std::abs(g - targetColor_.g) < tolerance_ &&
	       std::abs(b - targetColor_.b) < tolerance_;
}

PixelBuffer &ColorMatchClassifier::apply(PixelBuffer &buffer) const
{
	buffer.requireNonEmpty("ColorMatchClassifier::apply");

	auto samples = buffer.samples();
	for (std::size_t i = 0; i < samples.size(); i += PixelBuffer::kChannels) {
		if (matches(samples[i], samples[i + 1], samples[i + 2])) {
			samples[i + 3] = 0;
		}
	}
	return buffer;
}

PixelBuffer &FuzzyClassifier::apply(PixelBuffer &buffer) const
{
	buffer.requireNonEmpty("FuzzyClassifier::apply");

	auto samples = buffer.samples();
	for (std::size_t i = 0; i < samples.size(); i += PixelBuffer::kChannels) {
		const double dr = samples[i] - targetColor_.r;
		const double dg = samples[i + 1] - targetColor_.g;
		const double db = samples[i + 2] - targetColor_.b;
		const double distance = std::sqrt(dr * dr + dg * dg + db * db);

		if (distance < tolerance_) {
			samples[i + 3] = static_cast<std::uint8_t>(std::lround(distance / tolerance_ * 255.0));
		}
	}
	return buffer;
}

bool ChromaKeyClassifier::matches(Imaging::Rgb color) const noexcept
{
	const Imaging::Hsl hsl = Imaging::rgbToHsl(color);
	return Imaging::hueDistance(hsl.h, targetHue_) < hueTolerance_ && hsl.s > saturationMin_;
}

PixelBuffer &ChromaKeyClassifier::apply(PixelBuffer &buffer) const
{
	buffer.requireNonEmpty("ChromaKeyClassifier::apply");

	auto samples = buffer.samples();
	for (std::size_t i = 0; i < samples.size(); i += PixelBuffer::kChannels) {
		if (matches({samples[i], samples[i + 1], samples[i + 2]})) {
			samples[i + 3] = 0;
		}
	}
	return buffer;
}

} // namespace PixelForge::BackgroundRemoval
