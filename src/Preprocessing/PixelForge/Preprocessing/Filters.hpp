/*
 * PixelForge Preprocessing Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <PixelForge/Imaging/PixelBuffer.hpp>

namespace PixelForge::Preprocessing {

struct PreprocessOptions {
	double blur = 0.0;
	double contrast = 0.0;
	double brightness = 0.0;
};

/**
 * @brief Box blur over all four channels with a (2 * floor(radius) + 1) square kernel.
 *
 * Near the border only the in-bounds samples are averaged.
 * @throws std::invalid_argument for a negative radius or an empty buffer.
 */
Imaging::PixelBuffer &boxBlur(Imaging::PixelBuffer &buffer, double radius);

/**
 * @brief Stretches RGB around mid-grey, leaving alpha alone.
 * @throws std::invalid_argument unless contrast is within [-255, 255].
 */
Imaging::PixelBuffer &adjustContrast(Imaging::PixelBuffer &buffer, double contrast);

/**
 * @throws std::invalid_argument for a brightness that is not finite.
 */
Imaging::PixelBuffer &adjustBrightness(Imaging::PixelBuffer &buffer, double brightness);

/**
 * @brief Runs blur, contrast and brightness in that order, skipping every zero setting.
 *
 * All settings are validated before the first filter touches the buffer.
 */
Imaging::PixelBuffer &applyPreprocessing(Imaging::PixelBuffer &buffer, const PreprocessOptions &options);

} // namespace PixelForge::Preprocessing
