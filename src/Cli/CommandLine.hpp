/*
 * PixelForge Command Line Tool
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <PixelForge/BackgroundRemoval/RemovalOptions.hpp>
#include <PixelForge/Imaging/Color.hpp>
#include <PixelForge/Preprocessing/Filters.hpp>
#include <PixelForge/Vectorizer/VectorizationOptions.hpp>

namespace PixelForge::Cli {

enum class Command { Help, Remove, Replace, Batch, Vectorize, Cutout };

struct CommandLine {
	Command command = Command::Help;

	std::string input;
	std::string output;
	std::string outputDir;
	std::vector<std::string> batchInputs;

	std::string method = "color";

	std::optional<Imaging::Rgb> replacementColor;
	std::string backgroundPath;

	BackgroundRemoval::RemovalOptions removal;
	Vectorizer::VectorizationOptions vectorization;
	Preprocessing::PreprocessOptions preprocess;

	bool pathOnly = false;
	bool verbose = false;
};

/**
 * @brief Parses the arguments that follow the program name.
 *
 * The first argument names the command. Every option takes exactly one value except
 * --path-only, --verbose and --help.
 * @throws std::invalid_argument on an unknown command or option, a missing or malformed
 *         value, or a missing required option.
 */
CommandLine parseCommandLine(std::span<const std::string_view> args);

std::string usage(std::string_view program);

} // namespace PixelForge::Cli
