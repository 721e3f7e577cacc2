/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <span>
#include <vector>

#include <PixelForge/Imaging/Geometry.hpp>

namespace PixelForge::Vectorizer {

using Contour = std::vector<Imaging::PathPoint>;

Contour toPathPoints(std::span<const Imaging::Point> contour);

/**
 * @brief Pulls sharp corners of a closed contour towards their neighbours.
 *
 * For each point, the angle between the incoming and outgoing edge is measured using
 * the cyclic neighbours of the unsmoothed contour. When that angle is below
 * pi - opttolerance the point is replaced by the centroid of itself and both
 * neighbours. Points with a zero-length edge are kept. Point count and order never
 * change, and contours of fewer than three points are returned as they are.
 */
Contour smoothContour(std::span<const Imaging::Point> contour, double opttolerance);

} // namespace PixelForge::Vectorizer
