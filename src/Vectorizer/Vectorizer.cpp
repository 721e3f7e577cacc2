/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Vectorizer/Vectorizer.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "PixelForge/Vectorizer/BinaryBitmap.hpp"
#include "PixelForge/Vectorizer/ContourTracer.hpp"
#include "PixelForge/Vectorizer/PathEmitter.hpp"

namespace PixelForge::Vectorizer {

namespace {

VectorizationOptions validateOptions(VectorizationOptions options)
{
	if (!(std::isfinite(options.scale) && options.scale > 0.0)) {
		throw std::invalid_argument(fmt::format("InvalidScale(Vectorizer::Vectorizer): {}", options.scale));
	}
	return options;
}

} // anonymous namespace

Vectorizer::Vectorizer(VectorizationOptions options, const Logger::ILogger &logger)
	: options_(validateOptions(std::move(options))),
	  logger_(logger)
{
}

VectorizationResult Vectorizer::trace(const Imaging::PixelBuffer &pixels) const
{
	pixels.requireNonEmpty("Vectorizer::trace");

	const BinaryBitmap bitmap = BinaryBitmap::fromPixels(pixels, options_.threshold);
	const std::vector<PixelContour> traced = ContourTracer(options_.turdsize).trace(bitmap);

	VectorizationResult result{{},
				   static_cast<double>(pixels.getWidth()) * options_.scale,
				   static_cast<double>(pixels.getHeight()) * options_.scale};
	result.contours.reserve(traced.size());
	for (const PixelContour &contour : traced) {
		result.contours.push_back(options_.optcurve ? smoothContour(contour, options_.opttolerance)
							    : toPathPoints(contour));
	}
	scaleContours(result.contours, options_.scale);

	logger_.debug("Vectorized {}x{} image: {} ink pixels, {} contours", pixels.getWidth(), pixels.getHeight(),
		      bitmap.countInk(), result.contours.size());

	return result;
}

std::string Vectorizer::toSvg(const Imaging::PixelBuffer &pixels) const
{
	const VectorizationResult result = trace(pixels);
	return toSvgDocument(result.contours, result.width, result.height, options_.fillColor);
}

PathDataResult Vectorizer::toPathData(const Imaging::PixelBuffer &pixels) const
{
	const VectorizationResult result = trace(pixels);
	return {PixelForge::Vectorizer::toPathData(result.contours), result.width, result.height};
}

std::string Vectorizer::vectorizeWithPreprocessing(Imaging::PixelBuffer pixels,
						   const Preprocessing::PreprocessOptions &preprocess) const
{
	Preprocessing::applyPreprocessing(pixels, preprocess);
	return toSvg(pixels);
}

} // namespace PixelForge::Vectorizer
