/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "PixelForge/BackgroundRemoval/ColorClassifiers.hpp"
#include "PixelForge/BackgroundRemoval/IBackgroundClassifier.hpp"
#include "PixelForge/BackgroundRemoval/RegionClassifiers.hpp"
#include "PixelForge/BackgroundRemoval/RemovalOptions.hpp"

namespace PixelForge::BackgroundRemoval {

namespace {

constexpr std::array<std::pair<std::string_view, RemovalMethod>, 5> kMethodNames = {{
	{"color", RemovalMethod::Color},
	{"fuzzy", RemovalMethod::Fuzzy},
	{"chroma-key", RemovalMethod::ChromaKey},
	{"flood-fill", RemovalMethod::FloodFill},
	{"edge-preserving", RemovalMethod::EdgePreserving},
}};

} // anonymous namespace

RemovalMethod parseRemovalMethod(std::string_view name)
{
	for (const auto &[methodName, method] : kMethodNames) {
		if (methodName == name) {
			return method;
		}
	}
	throw std::invalid_argument(fmt::format("UnknownMethod(parseRemovalMethod): {}", name));
}

std::string_view toString(RemovalMethod method) noexcept
{
	for (const auto &[methodName, candidate] : kMethodNames) {
		if (candidate == method) {
			return methodName;
		}
	}
	return "unknown";
}

std::unique_ptr<IBackgroundClassifier> makeClassifier(RemovalMethod method, const RemovalOptions &options)
{
	switch (method) {
	case RemovalMethod::Color:
		return std::make_unique<ColorMatchClassifier>(options.targetColor,
							      options.toleranceOr(DefaultTolerance::kColor));
	case RemovalMethod::Fuzzy:
		return std::make_unique<FuzzyClassifier>(options.targetColor,
							 options.toleranceOr(DefaultTolerance::kFuzzy));
	case RemovalMethod::ChromaKey:
		return std::make_unique<ChromaKeyClassifier>(options.targetHue, options.hueTolerance,
							     options.saturationMin);
	case RemovalMethod::FloodFill:
		return std::make_unique<FloodFillClassifier>(options.startX, options.startY,
							     options.toleranceOr(DefaultTolerance::kFloodFill));
	case RemovalMethod::EdgePreserving:
		return std::make_unique<EdgePreservingClassifier>(
			options.targetColor, options.toleranceOr(DefaultTolerance::kEdgePreserving));
	}
	throw std::invalid_argument(
		fmt::format("UnknownMethod(makeClassifier): {}", static_cast<int>(method)));
}

} // namespace PixelForge::BackgroundRemoval
