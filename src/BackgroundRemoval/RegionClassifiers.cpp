/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/BackgroundRemoval/RegionClassifiers.hpp"

#include <cstdlib>
#include <vector>

#include <PixelForge/Imaging/Geometry.hpp>

#include "PixelForge/BackgroundRemoval/ColorClassifiers.hpp"

namespace PixelForge::BackgroundRemoval {

using Imaging::PixelBuffer;
using Imaging::Point;

PixelBuffer &FloodFillClassifier::apply(PixelBuffer &buffer) const
{
	buffer.requireNonEmpty("FloodFillClassifier::apply");

	if (!buffer.contains(startX_, startY_)) {
		return buffer;
	}

	const std::int32_t width = static_cast<std::int32_t>(buffer.getWidth());
	const std::int32_t height = static_cast<std::int32_t>(buffer.getHeight());
	const Imaging::Rgba seed = buffer.at(static_cast<std::uint32_t>(startX_), static_cast<std::uint32_t>(startY_));

	std::vector<std::uint8_t> visited(buffer.getPixelCount(), 0);
	std::vector<Point> stack{{static_cast<std::int32_t>(startX_), static_cast<std::int32_t>(startY_)}};

	while (!stack.empty()) {
		const Point p = stack.back();
		stack.pop_back();

		if (p.x < 0 || p.x >= width || p.y < 0 || p.y >= height) {
			continue;
		}

		const std::size_t index = static_cast<std::size_t>(p.y) * width + p.x;
		if (visited[index]) {
			continue;
		}
		visited[index] = 1;

		const Imaging::Rgba pixel = buffer.at(p.x, p.y);
		if (std::abs(pixel.r - seed.r) <= tolerance_ && std::abs(pixel.g - seed.g) <= tolerance_ &&
		    std::abs(pixel.b - seed.b) <= tolerance_) {
			buffer.setAlpha(p.x, p.y, 0);

			stack.push_back({p.x + 1, p.y});
			stack.push_back({p.x - 1, p.y});
			stack.push_back({p.x, p.y + 1});
			stack.push_back({p.x, p.y - 1});
		}
	}

	return buffer;
}

PixelBuffer &EdgePreservingClassifier::apply(PixelBuffer &buffer) const
{
	buffer.requireNonEmpty("EdgePreservingClassifier::apply");

	const std::uint32_t width = buffer.getWidth();
	const std::uint32_t height = buffer.getHeight();
	const ColorMatchClassifier candidateTest(targetColor_, tolerance_);

	std::vector<std::uint8_t> candidates(buffer.getPixelCount(), 0);
	for (std::uint32_t y = 0; y < height; ++y) {
		for (std::uint32_t x = 0; x < width; ++x) {
			const Imaging::Rgba pixel = buffer.at(x, y);
			candidates[static_cast<std::size_t>(y) * width + x] =
				candidateTest.matches(pixel.r, pixel.g, pixel.b) ? 1 : 0;
		}
	}

	for (std::uint32_t y = 1; y + 1 < height; ++y) {
		for (std::uint32_t x = 1; x + 1 < width; ++x) {
			if (!candidates[static_cast<std::size_t>(y) * width + x]) {
				continue;
			}

			int neighborCount = 0;
			for (std::uint32_t ny = y - 1; ny <= y + 1; ++ny) {
				for (std::uint32_t nx = x - 1; nx <= x + 1; ++nx) {
					if ((nx != x || ny != y) && candidates[static_cast<std::size_t>(ny) * width + nx]) {
						++neighborCount;
					}
				}
			}

			buffer.setAlpha(x, y, static_cast<std::uint8_t>(neighborCount < 8 ? 255 * neighborCount / 8 : 0));
		}
	}

	return buffer;
}

} // namespace PixelForge::BackgroundRemoval
