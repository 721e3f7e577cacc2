/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <PixelForge/Imaging/PixelBuffer.hpp>
#include <PixelForge/Logger/ILogger.hpp>

#include "RemovalOptions.hpp"

namespace PixelForge::BackgroundRemoval {

struct BatchItemResult {
	std::size_t index;
	bool success;
	std::string error;
};

/**
 * @brief Applies one removal method to each buffer independently, in input order.
 *
 * The method name is resolved once up front, so an unknown name throws
 * std::invalid_argument before any buffer is touched. After that, a failing item is
 * logged and reported in its result without affecting the others. Successful items are
 * modified in place.
 */
std::vector<BatchItemResult> removeBackgroundBatch(std::span<Imaging::PixelBuffer> buffers, std::string_view method,
						   const RemovalOptions &options, const Logger::ILogger &logger);

} // namespace PixelForge::BackgroundRemoval
