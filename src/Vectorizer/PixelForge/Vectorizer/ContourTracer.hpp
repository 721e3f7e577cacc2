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
#include <vector>

#include <PixelForge/Imaging/Geometry.hpp>

#include "BinaryBitmap.hpp"

namespace PixelForge::Vectorizer {

using PixelContour = std::vector<Imaging::Point>;

/**
 * @class ContourTracer
 * @brief Walks the boundaries of the ink regions of a BinaryBitmap.
 *
 * The bitmap is scanned row by row. Every unvisited boundary pixel starts a walk that
 * heads right and, at each step, tries right, down, left and up rotated so that the
 * current heading is tried first. The walk ends when it returns to its start, when it
 * has no ink neighbour, or when it grows beyond width * height points.
 *
 * Contours come out in scan order with their points in walk order. Walks of two or
 * fewer points and contours shorter than turdsize are dropped.
 */
class ContourTracer {
public:
	explicit ContourTracer(std::size_t turdsize) noexcept : turdsize_(turdsize) {}

	std::vector<PixelContour> trace(const BinaryBitmap &bitmap) const;

	std::size_t getTurdsize() const noexcept { return turdsize_; }

private:
	const std::size_t turdsize_;
};

} // namespace PixelForge::Vectorizer
