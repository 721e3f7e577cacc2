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
#include <string>
#include <vector>

#include <PixelForge/BackgroundRemoval/BatchRemoval.hpp>
#include <PixelForge/Logger/ConsoleLogger.hpp>

#include "../Fixture.hpp"
#include "../NullLogger.hpp"

using namespace PixelForge::BackgroundRemoval;
using namespace PixelForge::Imaging;

class BatchRemovalTest : public ::testing::Test {
protected:
	NullLogger logger;
	std::vector<PixelBuffer> buffers;

	void SetUp() override
	{
		buffers.push_back(Fixture::makeRectangleImage(4, 4, 1, 1, 2, 2));
		buffers.emplace_back();
		buffers.push_back(PixelBuffer(3, 3, Fixture::NEAR_WHITE));
	}
};

TEST_F(BatchRemovalTest, OneResultPerInputInOrder)
{
	const std::vector<BatchItemResult> results = removeBackgroundBatch(buffers, "color", {}, logger);

	ASSERT_EQ(results.size(), 3u);
	for (std::size_t i = 0; i < results.size(); ++i) {
		EXPECT_EQ(results[i].index, i);
	}
}

TEST_F(BatchRemovalTest, OnlyTheEmptyItemFails)
{
	const std::vector<BatchItemResult> results = removeBackgroundBatch(buffers, "color", {}, logger);

	EXPECT_TRUE(results[0].success);
	EXPECT_FALSE(results[1].success);
	EXPECT_FALSE(results[1].error.empty());
	EXPECT_TRUE(results[2].success);
	EXPECT_TRUE(results[2].error.empty());
}

TEST_F(BatchRemovalTest, SuccessfulItemsAreModifiedInPlace)
{
	removeBackgroundBatch(buffers, "color", {}, logger);

	EXPECT_EQ(buffers[0].at(0, 0).a, 0);
	EXPECT_EQ(buffers[0].at(1, 1).a, 255);
	EXPECT_EQ(buffers[2].at(2, 2).a, 0);
}

TEST_F(BatchRemovalTest, UnknownMethodThrowsBeforeTouchingAnything)
{
	const std::vector<PixelBuffer> before = buffers;

	EXPECT_THROW(removeBackgroundBatch(buffers, "sharpen", {}, logger), std::invalid_argument);
	EXPECT_EQ(buffers, before);
}

TEST_F(BatchRemovalTest, MatchesSingleImageRemoval)
{
	std::vector<PixelBuffer> again = buffers;

	removeBackgroundBatch(buffers, "fuzzy", {}, logger);
	removeBackgroundBatch(again, "fuzzy", {}, logger);

	EXPECT_EQ(buffers, again);
}

TEST(BatchRemovalEmptyTest, NoInputsNoResults)
{
	NullLogger logger;
	std::vector<PixelBuffer> buffers;
	EXPECT_TRUE(removeBackgroundBatch(buffers, "flood-fill", {}, logger).empty());
}

TEST_F(BatchRemovalTest, SummaryIsLoggedAsStructuredRecord)
{
	const PixelForge::Logger::ConsoleLogger console("[batch]");

	testing::internal::CaptureStderr();
	removeBackgroundBatch(buffers, "fuzzy", {}, console);
	const std::string output = testing::internal::GetCapturedStderr();

	EXPECT_NE(output.find("[INFO] [batch] name=BatchFinished\t"), std::string::npos);
	EXPECT_NE(output.find("\tmethod=fuzzy\tsucceeded=2\tfailed=1\n"), std::string::npos);
}
