/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Vectorizer/ContourTracer.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace PixelForge::Vectorizer {

namespace {

using Imaging::Point;

// Right, down, left, up.
constexpr std::array<Point, 4> kDirections = {{{1, 0}, {0, 1}, {-1, 0}, {0, -1}}};

PixelContour walkBoundary(const BinaryBitmap &bitmap, Point start, std::vector<std::uint8_t> &visited)
{
	const std::uint32_t width = bitmap.getWidth();
	const std::size_t stepLimit = static_cast<std::size_t>(width) * bitmap.getHeight();

	PixelContour path;
	Point current = start;
	std::size_t heading = 0;

	do {
		visited[static_cast<std::size_t>(current.y) * width + static_cast<std::size_t>(current.x)] = 1;
		path.push_back(current);

		bool found = false;
		for (std::size_t turn = 0; turn < kDirections.size(); ++turn) {
			const std::size_t candidate = (heading + turn) % kDirections.size();
			const Point next{current.x + kDirections[candidate].x, current.y + kDirections[candidate].y};
			if (bitmap.isInk(next.x, next.y)) {
				current = next;
				heading = candidate;
				found = true;
				break;
			}
		}

		if (!found || path.size() > stepLimit)
			break;
	} while (current != start);

	return path;
}

} // anonymous namespace

std::vector<PixelContour> ContourTracer::trace(const BinaryBitmap &bitmap) const
{
	const std::uint32_t width = bitmap.getWidth();
	const std::uint32_t height = bitmap.getHeight();

	std::vector<std::uint8_t> visited(static_cast<std::size_t>(width) * height, 0);
	std::vector<PixelContour> contours;

	for (std::uint32_t y = 0; y < height; ++y) {
		for (std::uint32_t x = 0; x < width; ++x) {
			// Interior pixels never seed a walk; from there it could only wander until the step limit.
			if (visited[static_cast<std::size_t>(y) * width + x] || !bitmap.isBoundary(x, y))
				continue;

			PixelContour path = walkBoundary(
				bitmap, {static_cast<std::int32_t>(x), static_cast<std::int32_t>(y)}, visited);
			if (path.size() <= 2 || path.size() < turdsize_)
				continue;

			contours.push_back(std::move(path));
		}
	}

	return contours;
}

} // namespace PixelForge::Vectorizer
