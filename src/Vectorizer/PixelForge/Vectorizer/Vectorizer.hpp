/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <string>
#include <vector>

#include <PixelForge/Imaging/PixelBuffer.hpp>
#include <PixelForge/Logger/ILogger.hpp>
#include <PixelForge/Preprocessing/Filters.hpp>

#include "PathSmoother.hpp"
#include "VectorizationOptions.hpp"

namespace PixelForge::Vectorizer {

/**
 * @brief Traced contours in output coordinates, that is, already multiplied by scale.
 */
struct VectorizationResult {
	std::vector<Contour> contours;
	double width;
	double height;
};

struct PathDataResult {
	std::string pathData;
	double width;
	double height;
};

/**
 * @class Vectorizer
 * @brief Turns a raster image into closed polygon paths.
 *
 * Binarizes, traces, filters by turdsize, optionally smooths and finally scales. Each
 * call works on its own copy of the intermediate data, so one instance can be shared
 * between threads as long as the logger allows it.
 */
class Vectorizer {
public:
	/**
	 * @throws std::invalid_argument if scale is not a positive finite number.
	 */
	Vectorizer(VectorizationOptions options, const Logger::ILogger &logger);

	const VectorizationOptions &getOptions() const noexcept { return options_; }

	/**
	 * @throws std::invalid_argument for an empty buffer.
	 */
	VectorizationResult trace(const Imaging::PixelBuffer &pixels) const;

	std::string toSvg(const Imaging::PixelBuffer &pixels) const;
	PathDataResult toPathData(const Imaging::PixelBuffer &pixels) const;

	/**
	 * @brief Filters a copy of the image before producing the SVG document.
	 */
	std::string vectorizeWithPreprocessing(Imaging::PixelBuffer pixels,
					       const Preprocessing::PreprocessOptions &preprocess) const;

private:
	const VectorizationOptions options_;
	const Logger::ILogger &logger_;
};

} // namespace PixelForge::Vectorizer
