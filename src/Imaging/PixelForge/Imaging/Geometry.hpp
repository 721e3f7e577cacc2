/*
 * PixelForge Imaging Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace PixelForge::Imaging {

struct Point {
	std::int32_t x;
	std::int32_t y;

	bool operator==(const Point &) const = default;
};

struct PathPoint {
	double x;
	double y;

	bool operator==(const PathPoint &) const = default;
};

struct Bounds {
	double minX;
	double minY;
	double maxX;
	double maxY;
};

/**
 * @brief Axis-aligned bounds of a non-empty point list.
 */
inline Bounds boundsOf(const std::vector<PathPoint> &points) noexcept
{
	Bounds bounds{points.front().x, points.front().y, points.front().x, points.front().y};
	for (const PathPoint &p : points) {
		if (p.x < bounds.minX)
			bounds.minX = p.x;
		if (p.x > bounds.maxX)
			bounds.maxX = p.x;
		if (p.y < bounds.minY)
			bounds.minY = p.y;
		if (p.y > bounds.maxY)
			bounds.maxY = p.y;
	}
	return bounds;
}

} // namespace PixelForge::Imaging
