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
#include <string>
#include <string_view>

#include "PathSmoother.hpp"

namespace PixelForge::Vectorizer {

/**
 * @brief Multiplies every coordinate by scale in place.
 */
void scaleContours(std::span<Contour> contours, double scale) noexcept;

/**
 * @brief Writes one contour as "M x y L x y ... Z".
 *
 * Numbers use the shortest representation that round-trips, so integral values carry
 * no fractional part.
 */
std::string toPathCommands(const Contour &contour);

/**
 * @brief Joins the path commands of every contour with a single space.
 *
 * Returns an empty string when there are no contours.
 */
std::string toPathData(std::span<const Contour> contours);

/**
 * @brief Builds a standalone SVG document with one evenodd path element per contour.
 *
 * width and height fill the viewBox and the width/height attributes.
 */
std::string toSvgDocument(std::span<const Contour> contours, double width, double height,
			  std::string_view fillColor);

} // namespace PixelForge::Vectorizer
