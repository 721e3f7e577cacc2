/*
 * PixelForge Command Line Tool
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "CommandLine.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace PixelForge::Cli {

namespace {

Command parseCommand(std::string_view name)
{
	if (name == "help" || name == "--help" || name == "-h")
		return Command::Help;
	if (name == "remove")
		return Command::Remove;
	if (name == "replace")
		return Command::Replace;
	if (name == "batch")
		return Command::Batch;
	if (name == "vectorize")
		return Command::Vectorize;
	if (name == "cutout")
		return Command::Cutout;
	throw std::invalid_argument(fmt::format("UnknownCommand(parseCommandLine): {}", name));
}

double parseDouble(std::string_view option, std::string_view text)
{
	const std::string value(text);
	std::size_t consumed = 0;
	double result = 0.0;
	try {
		result = std::stod(value, &consumed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument(fmt::format("InvalidNumber(parseCommandLine): {} '{}'", option, text));
	}
	if (consumed != value.size() || !std::isfinite(result)) {
		throw std::invalid_argument(fmt::format("InvalidNumber(parseCommandLine): {} '{}'", option, text));
	}
	return result;
}

std::int64_t parseInteger(std::string_view option, std::string_view text)
{
	const std::string value(text);
	std::size_t consumed = 0;
	long long result = 0;
	try {
		result = std::stoll(value, &consumed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument(fmt::format("InvalidInteger(parseCommandLine): {} '{}'", option, text));
	}
	if (consumed != value.size()) {
		throw std::invalid_argument(fmt::format("InvalidInteger(parseCommandLine): {} '{}'", option, text));
	}
	return static_cast<std::int64_t>(result);
}

std::int64_t parseIntegerInRange(std::string_view option, std::string_view text, std::int64_t min,
				 std::int64_t max)
{
	const std::int64_t value = parseInteger(option, text);
	if (value < min || value > max) {
		throw std::invalid_argument(
			fmt::format("OutOfRange(parseCommandLine): {} must be within [{}, {}], got {}", option, min, max, value));
	}
	return value;
}

double parseNonNegative(std::string_view option, std::string_view text)
{
	const double value = parseDouble(option, text);
	if (value < 0.0) {
		throw std::invalid_argument(fmt::format("OutOfRange(parseCommandLine): {} must not be negative", option));
	}
	return value;
}

bool parseBool(std::string_view option, std::string_view text)
{
	if (text == "true" || text == "1" || text == "yes")
		return true;
	if (text == "false" || text == "0" || text == "no")
		return false;
	throw std::invalid_argument(fmt::format("InvalidBoolean(parseCommandLine): {} '{}'", option, text));
}

void requireOption(bool present, Command command, std::string_view option)
{
	if (present)
		return;

	std::string_view name = "?";
	switch (command) {
	case Command::Remove:
		name = "remove";
		break;
	case Command::Replace:
		name = "replace";
		break;
	case Command::Batch:
		name = "batch";
		break;
	case Command::Vectorize:
		name = "vectorize";
		break;
	case Command::Cutout:
		name = "cutout";
		break;
	case Command::Help:
		name = "help";
		break;
	}
	throw std::invalid_argument(fmt::format("MissingOption(parseCommandLine): {} requires {}", name, option));
}

void validate(const CommandLine &cli)
{
	if (cli.command == Command::Help)
		return;

	if (cli.command == Command::Batch) {
		requireOption(!cli.outputDir.empty(), cli.command, "--output-dir");
		requireOption(!cli.batchInputs.empty(), cli.command, "at least one input file");
		return;
	}

	if (!cli.batchInputs.empty()) {
		throw std::invalid_argument(
			fmt::format("UnexpectedArgument(parseCommandLine): {}", cli.batchInputs.front()));
	}
	requireOption(!cli.input.empty(), cli.command, "--input");
	requireOption(!cli.output.empty(), cli.command, "--output");

	if (cli.command == Command::Replace) {
		const bool hasColor = cli.replacementColor.has_value();
		const bool hasImage = !cli.backgroundPath.empty();
		if (hasColor == hasImage) {
			throw std::invalid_argument(
				"ConflictingOptions(parseCommandLine): replace takes exactly one of --color or --background");
		}
	}
}

} // anonymous namespace

CommandLine parseCommandLine(std::span<const std::string_view> args)
{
	if (args.empty()) {
		throw std::invalid_argument("MissingCommand(parseCommandLine): no command given");
	}

	CommandLine cli;
	cli.command = parseCommand(args[0]);
	if (cli.command == Command::Help)
		return cli;

	for (std::size_t i = 1; i < args.size(); ++i) {
		const std::string_view arg = args[i];

		if (arg == "--help" || arg == "-h") {
			cli.command = Command::Help;
			return cli;
		}
		if (arg == "--path-only") {
			cli.pathOnly = true;
			continue;
		}
		if (arg == "--verbose") {
			cli.verbose = true;
			continue;
		}
		if (!arg.starts_with("--")) {
			cli.batchInputs.emplace_back(arg);
			continue;
		}

		if (i + 1 >= args.size()) {
			throw std::invalid_argument(fmt::format("MissingValue(parseCommandLine): {}", arg));
		}
		const std::string_view value = args[++i];

		if (arg == "--input") {
			cli.input = value;
		} else if (arg == "--output") {
			cli.output = value;
		} else if (arg == "--output-dir") {
			cli.outputDir = value;
		} else if (arg == "--method") {
			cli.method = BackgroundRemoval::toString(BackgroundRemoval::parseRemovalMethod(value));
		} else if (arg == "--color") {
			cli.replacementColor = Imaging::parseColor(value);
		} else if (arg == "--background") {
			cli.backgroundPath = value;
		} else if (arg == "--target-color") {
			cli.removal.targetColor = Imaging::parseColor(value);
		} else if (arg == "--tolerance") {
			cli.removal.tolerance = parseNonNegative(arg, value);
		} else if (arg == "--target-hue") {
			cli.removal.targetHue = parseDouble(arg, value);
		} else if (arg == "--hue-tolerance") {
			cli.removal.hueTolerance = parseNonNegative(arg, value);
		} else if (arg == "--saturation-min") {
			cli.removal.saturationMin = parseDouble(arg, value);
		} else if (arg == "--start-x") {
			cli.removal.startX = parseInteger(arg, value);
		} else if (arg == "--start-y") {
			cli.removal.startY = parseInteger(arg, value);
		} else if (arg == "--threshold") {
			cli.vectorization.threshold = static_cast<std::uint8_t>(parseIntegerInRange(arg, value, 0, 255));
		} else if (arg == "--turdsize") {
			cli.vectorization.turdsize =
				static_cast<std::size_t>(parseIntegerInRange(arg, value, 0, std::numeric_limits<std::int32_t>::max()));
		} else if (arg == "--optcurve") {
			cli.vectorization.optcurve = parseBool(arg, value);
		} else if (arg == "--opttolerance") {
			cli.vectorization.opttolerance = parseDouble(arg, value);
		} else if (arg == "--scale") {
			cli.vectorization.scale = parseDouble(arg, value);
			if (cli.vectorization.scale <= 0.0) {
				throw std::invalid_argument("OutOfRange(parseCommandLine): --scale must be positive");
			}
		} else if (arg == "--fill-color") {
			cli.vectorization.fillColor = Imaging::toHexString(Imaging::parseColor(value));
		} else if (arg == "--blur") {
			cli.preprocess.blur = parseNonNegative(arg, value);
		} else if (arg == "--contrast") {
			cli.preprocess.contrast = parseDouble(arg, value);
			if (cli.preprocess.contrast < -255.0 || cli.preprocess.contrast > 255.0) {
				throw std::invalid_argument("OutOfRange(parseCommandLine): --contrast must be within [-255, 255]");
			}
		} else if (arg == "--brightness") {
			cli.preprocess.brightness = parseDouble(arg, value);
		} else {
			throw std::invalid_argument(fmt::format("UnknownOption(parseCommandLine): {}", arg));
		}
	}

	validate(cli);
	return cli;
}

std::string usage(std::string_view program)
{
	return fmt::format(R"(Usage: {0} <command> [options]

Commands:
  remove     --input IN --output OUT [--method M]
  replace    --input IN --output OUT (--color C | --background IMG)
  batch      --output-dir DIR [--method M] IN...
  vectorize  --input IN --output OUT [--path-only] [--blur R] [--contrast C] [--brightness B]
  cutout     --input IN --output OUT

Removal options:
  --method M             color, fuzzy, chroma-key, flood-fill or edge-preserving (default color)
  --target-color C       #rgb, #rrggbb, rgb(r, g, b) or a colour name (default white)
  --tolerance T          per-channel or distance tolerance (default depends on method)
  --target-hue H         chroma key hue in degrees (default 120)
  --hue-tolerance T      chroma key hue window in degrees (default 15)
  --saturation-min S     chroma key minimum saturation (default 0.3)
  --start-x X            flood fill seed column (default 0)
  --start-y Y            flood fill seed row (default 0)

Vectorization options:
  --threshold N          luminance threshold 0-255 (default 128)
  --turdsize N           minimum contour point count (default 5)
  --optcurve BOOL        smooth sharp corners (default true)
  --opttolerance A       smoothing angle tolerance in radians (default 1)
  --scale K              output scale factor (default 1)
  --fill-color C         path fill colour (default #000000)

  --verbose              log debug messages
)",
			   program);
}

} // namespace PixelForge::Cli
