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

#include "IBackgroundClassifier.hpp"

namespace PixelForge::BackgroundRemoval {

/**
 * @brief 4-connected flood fill from a seed pixel.
 *
 * A pixel joins the region when each RGB channel is within the tolerance (inclusive) of
 * the seed's own colour. A seed outside the buffer leaves it untouched.
 */
class FloodFillClassifier final : public IBackgroundClassifier {
public:
	FloodFillClassifier(std::int64_t startX, std::int64_t startY, double tolerance) noexcept
		: startX_(startX),
		  startY_(startY),
		  tolerance_(tolerance)
	{
	}

	~FloodFillClassifier() noexcept override = default;

	RemovalMethod getMethod() const noexcept override { return RemovalMethod::FloodFill; }

	Imaging::PixelBuffer &apply(Imaging::PixelBuffer &buffer) const override;

private:
	const std::int64_t startX_;
	const std::int64_t startY_;
	const double tolerance_;
};

/**
 * @brief Two-pass removal that fades alpha along the edge of the background region.
 *
 * Pass one flags candidates with the same test as ColorMatchClassifier. Pass two gives
 * each candidate that is not on the image border alpha = floor(255 * n / 8), where n
 * counts candidate pixels among its eight neighbours. A candidate with n == 8 becomes
 * fully transparent.
 */
class EdgePreservingClassifier final : public IBackgroundClassifier {
public:
	EdgePreservingClassifier(Imaging::Rgb targetColor, double tolerance) noexcept
		: targetColor_(targetColor),
		  tolerance_(tolerance)
	{
	}

	~EdgePreservingClassifier() noexcept override = default;

	RemovalMethod getMethod() const noexcept override { return RemovalMethod::EdgePreserving; }

	Imaging::PixelBuffer &apply(Imaging::PixelBuffer &buffer) const override;

private:
	const Imaging::Rgb targetColor_;
	const double tolerance_;
};

} // namespace PixelForge::BackgroundRemoval
