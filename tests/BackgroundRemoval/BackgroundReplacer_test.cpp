/*
 * PixelForge
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include <PixelForge/BackgroundRemoval/BackgroundReplacer.hpp>
#include <PixelForge/BackgroundRemoval/ColorClassifiers.hpp>

#include "../Fixture.hpp"

using namespace PixelForge::BackgroundRemoval;
using namespace PixelForge::Imaging;

TEST(ReplaceBackgroundColorTest, TransparentPixelsTakeTheColour)
{
	PixelBuffer buffer(2, 2, Fixture::CLEAR);
	replaceBackground(buffer, Rgb{255, 0, 0});
	EXPECT_EQ(buffer.at(0, 0), Fixture::RED);
	EXPECT_EQ(buffer.at(1, 1), Fixture::RED);
}

TEST(ReplaceBackgroundColorTest, OpaquePixelsAreUntouched)
{
	PixelBuffer buffer(2, 1, Fixture::BLUE);
	replaceBackground(buffer, Rgb{255, 0, 0});
	EXPECT_EQ(buffer.at(0, 0), Fixture::BLUE);
}

TEST(ReplaceBackgroundColorTest, HalfTransparentPixelsBlend)
{
	PixelBuffer buffer(1, 1, Rgba{0, 0, 0, 128});
	replaceBackground(buffer, kWhite);
	EXPECT_EQ(buffer.at(0, 0), (Rgba{127, 127, 127, 255}));
}

TEST(ReplaceBackgroundColorTest, AfterColourRemoval)
{
	PixelBuffer buffer = Fixture::makeRectangleImage(4, 4, 1, 1, 2, 2);
	ColorMatchClassifier(kWhite, 10.0).apply(buffer);
	replaceBackground(buffer, Rgb{0, 255, 0});

	EXPECT_EQ(buffer.at(0, 0), Fixture::GREEN);
	EXPECT_EQ(buffer.at(1, 1), Fixture::BLACK);
}

TEST(ReplaceBackgroundImageTest, CompositesPerPixel)
{
	PixelBuffer foreground(2, 1, Fixture::CLEAR);
	foreground.set(1, 0, Fixture::BLACK);
	PixelBuffer background(2, 1, Fixture::BLUE);
	background.set(1, 0, Fixture::RED);

	replaceBackground(foreground, background);

	EXPECT_EQ(foreground.at(0, 0), Fixture::BLUE);
	EXPECT_EQ(foreground.at(1, 0), Fixture::BLACK);
}

TEST(ReplaceBackgroundImageTest, BothTransparentStaysTransparent)
{
	PixelBuffer foreground(1, 1, Rgba{10, 20, 30, 0});
	const PixelBuffer background(1, 1, Rgba{40, 50, 60, 0});

	replaceBackground(foreground, background);

	EXPECT_EQ(foreground.at(0, 0), Fixture::CLEAR);
}

TEST(ReplaceBackgroundImageTest, DimensionMismatchThrowsBeforeMutation)
{
	PixelBuffer foreground(2, 2, Fixture::CLEAR);
	const PixelBuffer before = foreground;
	const PixelBuffer background(3, 2, Fixture::RED);

	EXPECT_THROW(replaceBackground(foreground, background), std::invalid_argument);
	EXPECT_EQ(foreground, before);
}

TEST(ReplaceBackgroundImageTest, EmptyBuffersThrow)
{
	PixelBuffer empty;
	const PixelBuffer background(1, 1, Fixture::RED);
	EXPECT_THROW(replaceBackground(empty, background), std::invalid_argument);
	EXPECT_THROW(replaceBackground(empty, kWhite), std::invalid_argument);
}
