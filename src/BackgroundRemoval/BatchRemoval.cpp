/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/BackgroundRemoval/BatchRemoval.hpp"

#include <exception>
#include <memory>

#include <fmt/format.h>

#include "PixelForge/BackgroundRemoval/IBackgroundClassifier.hpp"

namespace PixelForge::BackgroundRemoval {

std::vector<BatchItemResult> removeBackgroundBatch(std::span<Imaging::PixelBuffer> buffers, std::string_view method,
						   const RemovalOptions &options, const Logger::ILogger &logger)
{
	const std::unique_ptr<IBackgroundClassifier> classifier = makeClassifier(parseRemovalMethod(method), options);

	std::vector<BatchItemResult> results;
	results.reserve(buffers.size());

	for (std::size_t i = 0; i < buffers.size(); ++i) {
		try {
			classifier->apply(buffers[i]);
			results.push_back({i, true, {}});
		} catch (const std::exception &e) {
			logger.logException(e, fmt::format("Batch item {} failed", i));
			results.push_back({i, false, e.what()});
		}
	}

	std::size_t failed = 0;
	for (const BatchItemResult &result : results) {
		if (!result.success)
			++failed;
	}
	logger.info("BatchFinished", {{"method", method},
				      {"succeeded", fmt::format("{}", results.size() - failed)},
				      {"failed", fmt::format("{}", failed)}});

	return results;
}

} // namespace PixelForge::BackgroundRemoval
