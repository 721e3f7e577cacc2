/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Vectorizer/PathSmoother.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace PixelForge::Vectorizer {

namespace {

using Imaging::PathPoint;
using Imaging::Point;

bool isSharpCorner(Point prev, Point curr, Point next, double opttolerance) noexcept
{
	const double dx1 = curr.x - prev.x;
	const double dy1 = curr.y - prev.y;
	const double dx2 = next.x - curr.x;
	const double dy2 = next.y - curr.y;

	const double len1 = std::hypot(dx1, dy1);
	const double len2 = std::hypot(dx2, dy2);
	if (len1 == 0.0 || len2 == 0.0)
		return false;

	const double cosine = std::clamp((dx1 * dx2 + dy1 * dy2) / (len1 * len2), -1.0, 1.0);
	return std::acos(cosine) < std::numbers::pi - opttolerance;
}

} // anonymous namespace

Contour toPathPoints(std::span<const Point> contour)
{
	Contour points;
	points.reserve(contour.size());
	for (const Point &p : contour) {
		points.push_back({static_cast<double>(p.x), static_cast<double>(p.y)});
	}
	return points;
}

Contour smoothContour(std::span<const Point> contour, double opttolerance)
{
	const std::size_t n = contour.size();
	if (n < 3)
		return toPathPoints(contour);

	Contour smoothed;
	smoothed.reserve(n);

	for (std::size_t i = 0; i < n; ++i) {
		const Point prev = contour[(i + n - 1) % n];
		const Point curr = contour[i];
		const Point next = contour[(i + 1) % n];

		if (isSharpCorner(prev, curr, next, opttolerance)) {
			smoothed.push_back({(prev.x + curr.x + next.x) / 3.0, (prev.y + curr.y + next.y) / 3.0});
		} else {
			smoothed.push_back({static_cast<double>(curr.x), static_cast<double>(curr.y)});
		}
	}

	return smoothed;
}

} // namespace PixelForge::Vectorizer
