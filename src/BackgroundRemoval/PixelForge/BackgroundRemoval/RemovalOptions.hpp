/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <PixelForge/Imaging/Color.hpp>

namespace PixelForge::BackgroundRemoval {

enum class RemovalMethod : int {
	Color = 0,
	Fuzzy = 1,
	ChromaKey = 2,
	FloodFill = 3,
	EdgePreserving = 4,
};

namespace DefaultTolerance {
constexpr double kColor = 10.0;
constexpr double kFuzzy = 30.0;
constexpr double kFloodFill = 10.0;
constexpr double kEdgePreserving = 15.0;
} // namespace DefaultTolerance

/**
 * @brief Inputs for every removal method. Each method reads only the fields it needs.
 *
 * An unset tolerance falls back to the method's own default (see DefaultTolerance).
 */
struct RemovalOptions {
	Imaging::Rgb targetColor = Imaging::kWhite;

	std::optional<double> tolerance;

	double targetHue = 120.0;
	double hueTolerance = 15.0;
	double saturationMin = 0.3;

	std::int64_t startX = 0;
	std::int64_t startY = 0;

	double toleranceOr(double fallback) const noexcept { return tolerance.value_or(fallback); }
};

/**
 * @brief Maps "color", "fuzzy", "chroma-key", "flood-fill" or "edge-preserving" to a method.
 * @throws std::invalid_argument for any other name.
 */
RemovalMethod parseRemovalMethod(std::string_view name);

std::string_view toString(RemovalMethod method) noexcept;

} // namespace PixelForge::BackgroundRemoval
