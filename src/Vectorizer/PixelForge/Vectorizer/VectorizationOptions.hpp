/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace PixelForge::Vectorizer {

struct VectorizationOptions {
	// Luminance at or below which an opaque pixel counts as ink.
	std::uint8_t threshold = 128;

	// Minimum number of points a contour needs to survive.
	std::size_t turdsize = 5;

	bool optcurve = true;
	double opttolerance = 1.0;

	double scale = 1.0;

	std::string fillColor = "#000000";
};

} // namespace PixelForge::Vectorizer
