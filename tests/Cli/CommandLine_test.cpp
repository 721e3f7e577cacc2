/*
 * PixelForge
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "CommandLine.hpp"

using namespace PixelForge;
using Cli::Command;
using Cli::CommandLine;

namespace {

CommandLine parse(std::initializer_list<std::string_view> args)
{
	const std::vector<std::string_view> argv(args);
	return Cli::parseCommandLine(argv);
}

} // anonymous namespace

TEST(CommandLineTest, RemoveWithDefaults)
{
	const CommandLine cli = parse({"remove", "--input", "in.png", "--output", "out.png"});

	EXPECT_EQ(cli.command, Command::Remove);
	EXPECT_EQ(cli.input, "in.png");
	EXPECT_EQ(cli.output, "out.png");
	EXPECT_EQ(cli.method, "color");
	EXPECT_EQ(cli.removal.targetColor, Imaging::kWhite);
	EXPECT_FALSE(cli.removal.tolerance.has_value());
	EXPECT_FALSE(cli.verbose);
}

TEST(CommandLineTest, RemovalOptions)
{
	const CommandLine cli =
		parse({"remove", "--input", "a", "--output", "b", "--method", "chroma-key", "--target-color", "#00ff00",
		       "--tolerance", "12.5", "--target-hue", "200", "--hue-tolerance", "20", "--saturation-min", "0.5",
		       "--start-x", "3", "--start-y", "-4", "--verbose"});

	EXPECT_EQ(cli.method, "chroma-key");
	EXPECT_EQ(cli.removal.targetColor, (Imaging::Rgb{0, 255, 0}));
	EXPECT_DOUBLE_EQ(cli.removal.tolerance.value(), 12.5);
	EXPECT_DOUBLE_EQ(cli.removal.targetHue, 200.0);
	EXPECT_DOUBLE_EQ(cli.removal.hueTolerance, 20.0);
	EXPECT_DOUBLE_EQ(cli.removal.saturationMin, 0.5);
	EXPECT_EQ(cli.removal.startX, 3);
	EXPECT_EQ(cli.removal.startY, -4);
	EXPECT_TRUE(cli.verbose);
}

TEST(CommandLineTest, VectorizeOptions)
{
	const CommandLine cli = parse({"vectorize", "--input", "a.png", "--output", "a.svg", "--threshold", "100",
				       "--turdsize", "2", "--optcurve", "false", "--opttolerance", "0.5", "--scale",
				       "2", "--fill-color", "red", "--path-only", "--blur", "1", "--contrast", "-30",
				       "--brightness", "15"});

	EXPECT_EQ(cli.command, Command::Vectorize);
	EXPECT_EQ(cli.vectorization.threshold, 100);
	EXPECT_EQ(cli.vectorization.turdsize, 2u);
	EXPECT_FALSE(cli.vectorization.optcurve);
	EXPECT_DOUBLE_EQ(cli.vectorization.opttolerance, 0.5);
	EXPECT_DOUBLE_EQ(cli.vectorization.scale, 2.0);
	EXPECT_EQ(cli.vectorization.fillColor, "#ff0000");
	EXPECT_TRUE(cli.pathOnly);
	EXPECT_DOUBLE_EQ(cli.preprocess.blur, 1.0);
	EXPECT_DOUBLE_EQ(cli.preprocess.contrast, -30.0);
	EXPECT_DOUBLE_EQ(cli.preprocess.brightness, 15.0);
}

TEST(CommandLineTest, BatchCollectsPositionalInputs)
{
	const CommandLine cli = parse({"batch", "--output-dir", "out", "a.png", "--method", "fuzzy", "b.jpg"});

	EXPECT_EQ(cli.command, Command::Batch);
	EXPECT_EQ(cli.outputDir, "out");
	EXPECT_EQ(cli.method, "fuzzy");
	EXPECT_EQ(cli.batchInputs, (std::vector<std::string>{"a.png", "b.jpg"}));
}

TEST(CommandLineTest, ReplaceNeedsExactlyOneBackground)
{
	EXPECT_NO_THROW(parse({"replace", "--input", "a", "--output", "b", "--color", "#123"}));
	EXPECT_NO_THROW(parse({"replace", "--input", "a", "--output", "b", "--background", "bg.png"}));
	EXPECT_THROW(parse({"replace", "--input", "a", "--output", "b"}), std::invalid_argument);
	EXPECT_THROW(parse({"replace", "--input", "a", "--output", "b", "--color", "red", "--background", "bg.png"}),
		     std::invalid_argument);
}

TEST(CommandLineTest, Help)
{
	EXPECT_EQ(parse({"help"}).command, Command::Help);
	EXPECT_EQ(parse({"--help"}).command, Command::Help);
	EXPECT_EQ(parse({"remove", "-h"}).command, Command::Help);
	EXPECT_NE(Cli::usage("pixelforge").find("Usage: pixelforge <command>"), std::string::npos);
}

TEST(CommandLineTest, RejectsBadInput)
{
	EXPECT_THROW(parse({}), std::invalid_argument);
	EXPECT_THROW(parse({"explode"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output", "b", "--frobnicate", "1"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output", "b", "--method", "magic"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output", "b", "--tolerance", "ten"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output", "b", "--tolerance", "-1"}), std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output", "b", "--target-color", "#12"}),
		     std::invalid_argument);
	EXPECT_THROW(parse({"remove", "--input", "a", "--output", "b", "stray"}), std::invalid_argument);
	EXPECT_THROW(parse({"vectorize", "--input", "a", "--output", "b", "--threshold", "256"}),
		     std::invalid_argument);
	EXPECT_THROW(parse({"vectorize", "--input", "a", "--output", "b", "--optcurve", "maybe"}),
		     std::invalid_argument);
	EXPECT_THROW(parse({"vectorize", "--input", "a", "--output", "b", "--scale", "0"}), std::invalid_argument);
	EXPECT_THROW(parse({"vectorize", "--input", "a", "--output", "b", "--turdsize", "3.5"}),
		     std::invalid_argument);
	EXPECT_THROW(parse({"batch", "a.png"}), std::invalid_argument);
	EXPECT_THROW(parse({"batch", "--output-dir", "out"}), std::invalid_argument);
}
