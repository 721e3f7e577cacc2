/*
 * PixelForge Command Line Tool
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <PixelForge/BackgroundRemoval/BackgroundReplacer.hpp>
#include <PixelForge/BackgroundRemoval/BatchRemoval.hpp>
#include <PixelForge/BackgroundRemoval/IBackgroundClassifier.hpp>
#include <PixelForge/ImageIO/ImageFile.hpp>
#include <PixelForge/Logger/ConsoleLogger.hpp>
#include <PixelForge/Vectorizer/Vectorizer.hpp>

#include "CommandLine.hpp"

using namespace PixelForge;

namespace {

void removeWith(BackgroundRemoval::RemovalMethod method, const Cli::CommandLine &cli, Imaging::PixelBuffer &image)
{
	const std::unique_ptr<BackgroundRemoval::IBackgroundClassifier> classifier =
		BackgroundRemoval::makeClassifier(method, cli.removal);
	classifier->apply(image);
}

int runRemove(const Cli::CommandLine &cli, const Logger::ILogger &logger)
{
	Imaging::PixelBuffer image = ImageIO::loadImage(cli.input);
	removeWith(BackgroundRemoval::parseRemovalMethod(cli.method), cli, image);
	ImageIO::saveImage(cli.output, image);
	logger.info("Removed background of {} with method {} into {}", cli.input, cli.method, cli.output);
	return 0;
}

int runReplace(const Cli::CommandLine &cli, const Logger::ILogger &logger)
{
	Imaging::PixelBuffer image = ImageIO::loadImage(cli.input);
	removeWith(BackgroundRemoval::RemovalMethod::Color, cli, image);

	if (cli.replacementColor) {
		BackgroundRemoval::replaceBackground(image, *cli.replacementColor);
		logger.info("Replaced background of {} with {}", cli.input, Imaging::toHexString(*cli.replacementColor));
	} else {
		const Imaging::PixelBuffer background = ImageIO::loadImage(cli.backgroundPath);
		BackgroundRemoval::replaceBackground(image, background);
		logger.info("Replaced background of {} with image {}", cli.input, cli.backgroundPath);
	}

	ImageIO::saveImage(cli.output, image);
	return 0;
}

int runBatch(const Cli::CommandLine &cli, const Logger::ILogger &logger)
{
	const std::size_t count = cli.batchInputs.size();
	std::vector<Imaging::PixelBuffer> images(count);
	std::vector<std::optional<std::string>> loadErrors(count);

	for (std::size_t i = 0; i < count; ++i) {
		try {
			images[i] = ImageIO::loadImage(cli.batchInputs[i]);
		} catch (const std::exception &e) {
			logger.logException(e, fmt::format("Failed to load {}", cli.batchInputs[i]));
			loadErrors[i] = e.what();
		}
	}

	const std::vector<BackgroundRemoval::BatchItemResult> results =
		BackgroundRemoval::removeBackgroundBatch(images, cli.method, cli.removal, logger);

	std::filesystem::create_directories(cli.outputDir);

	std::size_t failed = 0;
	for (const BackgroundRemoval::BatchItemResult &result : results) {
		const std::string &input = cli.batchInputs[result.index];
		std::string error = loadErrors[result.index].value_or(result.error);
		bool success = !loadErrors[result.index] && result.success;

		if (success) {
			const std::filesystem::path output = std::filesystem::path(cli.outputDir) /
							     std::filesystem::path(input).filename().replace_extension(".png");
			try {
				ImageIO::saveImage(output.string(), images[result.index]);
				fmt::print("ok\t{}\t{}\n", input, output.string());
			} catch (const std::exception &e) {
				logger.logException(e, fmt::format("Failed to save {}", output.string()));
				error = e.what();
				success = false;
			}
		}

		if (!success) {
			++failed;
			logger.warn("BatchItemFailed", {{"input", input}, {"error", error}});
			fmt::print("failed\t{}\t{}\n", input, error);
		}
	}

	logger.info("Batch finished: {} of {} images processed", count - failed, count);
	return failed == 0 ? 0 : 1;
}

int runVectorize(const Cli::CommandLine &cli, const Logger::ILogger &logger)
{
	const Imaging::PixelBuffer image = ImageIO::loadImage(cli.input);
	const Vectorizer::Vectorizer vectorizer(cli.vectorization, logger);

	if (cli.pathOnly) {
		Imaging::PixelBuffer filtered = image;
		Preprocessing::applyPreprocessing(filtered, cli.preprocess);
		const Vectorizer::PathDataResult path = vectorizer.toPathData(filtered);
		ImageIO::writeTextFile(cli.output, path.pathData);
		fmt::print("width={} height={}\n", path.width, path.height);
	} else {
		ImageIO::writeTextFile(cli.output, vectorizer.vectorizeWithPreprocessing(image, cli.preprocess));
	}

	logger.info("Vectorized {} into {}", cli.input, cli.output);
	return 0;
}

int runCutout(const Cli::CommandLine &cli, const Logger::ILogger &logger)
{
	Imaging::PixelBuffer image = ImageIO::loadImage(cli.input);
	removeWith(BackgroundRemoval::RemovalMethod::Color, cli, image);

	const Vectorizer::Vectorizer vectorizer(cli.vectorization, logger);
	ImageIO::writeTextFile(cli.output, vectorizer.toSvg(image));

	logger.info("Cut out {} into {}", cli.input, cli.output);
	return 0;
}

} // anonymous namespace

int main(int argc, char **argv)
{
	const std::string_view program = argc > 0 ? argv[0] : "pixelforge";
	const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

	Cli::CommandLine cli;
	try {
		cli = Cli::parseCommandLine(args);
	} catch (const std::invalid_argument &e) {
		fmt::print(stderr, "{}\n\n{}", e.what(), Cli::usage(program));
		return 2;
	}

	if (cli.command == Cli::Command::Help) {
		fmt::print("{}", Cli::usage(program));
		return 0;
	}

	const Logger::ConsoleLogger logger("[pixelforge]", cli.verbose ? Logger::LogLevel::Debug : Logger::LogLevel::Info);

	try {
		switch (cli.command) {
		case Cli::Command::Remove:
			return runRemove(cli, logger);
		case Cli::Command::Replace:
			return runReplace(cli, logger);
		case Cli::Command::Batch:
			return runBatch(cli, logger);
		case Cli::Command::Vectorize:
			return runVectorize(cli, logger);
		case Cli::Command::Cutout:
			return runCutout(cli, logger);
		case Cli::Command::Help:
			break;
		}
	} catch (const std::exception &e) {
		logger.logException(e, "pixelforge failed");
		return 1;
	}

	return 0;
}
