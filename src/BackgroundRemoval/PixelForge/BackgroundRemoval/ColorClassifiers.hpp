/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include "IBackgroundClassifier.hpp"

namespace PixelForge::BackgroundRemoval {

/**
 * @brief Clears alpha where every RGB channel differs from the target by less than the tolerance.
 */
class ColorMatchClassifier final : public IBackgroundClassifier {
public:
	ColorMatchClassifier(Imaging::Rgb targetColor, double tolerance) noexcept
		: targetColor_(targetColor),
		  tolerance_(tolerance)
	{
	}

	~ColorMatchClassifier() noexcept override = default;

	RemovalMethod getMethod() const noexcept override { return RemovalMethod::Color; }

	Imaging::PixelBuffer &apply(Imaging::PixelBuffer &buffer) const override;

	bool matches(std::uint8_t r, std::uint8_t g, std::uint8_t b) const noexcept;

private:
	const Imaging::Rgb targetColor_;
	const double tolerance_;
};

/**
 * @brief Graduated removal by Euclidean RGB distance.
 *
 * A pixel at distance d < tolerance gets alpha round(d / tolerance * 255). Pixels at or
 * beyond the tolerance radius keep their alpha as it was.
 */
class FuzzyClassifier final : public IBackgroundClassifier {
public:
	FuzzyClassifier(Imaging::Rgb targetColor, double tolerance) noexcept
		: targetColor_(targetColor),
		  tolerance_(tolerance)
	{
	}

	~FuzzyClassifier() noexcept override = default;

	RemovalMethod getMethod() const noexcept override { return RemovalMethod::Fuzzy; }

	Imaging::PixelBuffer &apply(Imaging::PixelBuffer &buffer) const override;

private:
	const Imaging::Rgb targetColor_;
	const double tolerance_;
};

/**
 * @brief Green/blue screen removal by hue window and minimum saturation.
 */
class ChromaKeyClassifier final : public IBackgroundClassifier {
public:
	ChromaKeyClassifier(double targetHue, double hueTolerance, double saturationMin) noexcept
		: targetHue_(targetHue),
		  hueTolerance_(hueTolerance),
		  saturationMin_(saturationMin)
	{
	}

	~ChromaKeyClassifier() noexcept override = default;

	RemovalMethod getMethod() const noexcept override { return RemovalMethod::ChromaKey; }

	Imaging::PixelBuffer &apply(Imaging::PixelBuffer &buffer) const override;

	bool matches(Imaging::Rgb color) const noexcept;

private:
	const double targetHue_;
	const double hueTolerance_;
	const double saturationMin_;
};

} // namespace PixelForge::BackgroundRemoval
