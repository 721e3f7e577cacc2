/*
 * PixelForge ImageIO Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <string>
#include <string_view>

#include <PixelForge/Imaging/PixelBuffer.hpp>

namespace PixelForge::ImageIO {

/**
 * @brief Decodes an image file into RGBA.
 *
 * Greyscale, BGR and BGRA sources are accepted. 16-bit sources are scaled down to
 * 8 bits per channel.
 * @throws std::runtime_error if the file cannot be read or decoded.
 */
Imaging::PixelBuffer loadImage(const std::string &path);

/**
 * @brief Encodes a buffer with the format implied by the file extension.
 * @throws std::invalid_argument for an empty buffer.
 * @throws std::runtime_error if encoding or writing fails.
 */
void saveImage(const std::string &path, const Imaging::PixelBuffer &buffer);

/**
 * @throws std::runtime_error if the file cannot be written.
 */
void writeTextFile(const std::string &path, std::string_view text);

} // namespace PixelForge::ImageIO
