/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <PixelForge/Imaging/Color.hpp>
#include <PixelForge/Imaging/PixelBuffer.hpp>

namespace PixelForge::BackgroundRemoval {

/**
 * @brief Composites the buffer (source-over) onto an opaque solid colour, in place.
 */
Imaging::PixelBuffer &replaceBackground(Imaging::PixelBuffer &foreground, Imaging::Rgb color);

/**
 * @brief Composites the buffer (source-over) onto another image, in place.
 * @throws std::invalid_argument if either buffer is empty or their sizes differ.
 */
Imaging::PixelBuffer &replaceBackground(Imaging::PixelBuffer &foreground, const Imaging::PixelBuffer &background);

} // namespace PixelForge::BackgroundRemoval
