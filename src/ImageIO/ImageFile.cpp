/*
 * PixelForge ImageIO Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/ImageIO/ImageFile.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <opencv2/opencv.hpp>

namespace PixelForge::ImageIO {

namespace {

cv::Mat toRgba(const cv::Mat &image)
{
	cv::Mat eightBit;
	if (image.depth() == CV_16U) {
		image.convertTo(eightBit, CV_8U, 1.0 / 257.0);
	} else if (image.depth() == CV_8U) {
		eightBit = image;
	} else {
		image.convertTo(eightBit, CV_8U);
	}

	cv::Mat rgba;
	switch (eightBit.channels()) {
	case 1:
		cv::cvtColor(eightBit, rgba, cv::COLOR_GRAY2RGBA);
		break;
	case 3:
		cv::cvtColor(eightBit, rgba, cv::COLOR_BGR2RGBA);
		break;
	case 4:
		cv::cvtColor(eightBit, rgba, cv::COLOR_BGRA2RGBA);
		break;
	default:
		throw std::runtime_error(
			fmt::format("UnsupportedChannelCount(loadImage): {} channels", eightBit.channels()));
	}
	return rgba;
}

} // anonymous namespace

Imaging::PixelBuffer loadImage(const std::string &path)
{
	const cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
	if (image.empty()) {
		throw std::runtime_error(fmt::format("ImageDecodeError(loadImage): cannot read '{}'", path));
	}

	const cv::Mat rgba = toRgba(image);
	const std::size_t rowBytes = static_cast<std::size_t>(rgba.cols) * Imaging::PixelBuffer::kChannels;

	std::vector<std::uint8_t> samples(rowBytes * static_cast<std::size_t>(rgba.rows));
	for (int y = 0; y < rgba.rows; ++y) {
		const std::uint8_t *row = rgba.ptr<std::uint8_t>(y);
		std::copy(row, row + rowBytes, samples.begin() + static_cast<std::ptrdiff_t>(rowBytes * y));
	}

	return Imaging::PixelBuffer(static_cast<std::uint32_t>(rgba.cols), static_cast<std::uint32_t>(rgba.rows),
				    std::move(samples));
}

void saveImage(const std::string &path, const Imaging::PixelBuffer &buffer)
{
	buffer.requireNonEmpty("saveImage");

	// cv::Mat wants a non-const pointer even though the data is only read here.
	const cv::Mat rgba(static_cast<int>(buffer.getHeight()), static_cast<int>(buffer.getWidth()), CV_8UC4,
			   const_cast<std::uint8_t *>(buffer.samples().data()));
	cv::Mat bgra;
	cv::cvtColor(rgba, bgra, cv::COLOR_RGBA2BGRA);

	bool written = false;
	try {
		written = cv::imwrite(path, bgra);
	} catch (const cv::Exception &e) {
		throw std::runtime_error(fmt::format("ImageEncodeError(saveImage): '{}': {}", path, e.what()));
	}
	if (!written) {
		throw std::runtime_error(fmt::format("ImageEncodeError(saveImage): cannot write '{}'", path));
	}
}

void writeTextFile(const std::string &path, std::string_view text)
{
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	if (!out) {
		throw std::runtime_error(fmt::format("FileOpenError(writeTextFile): cannot open '{}'", path));
	}
	out.write(text.data(), static_cast<std::streamsize>(text.size()));
	if (!out) {
		throw std::runtime_error(fmt::format("FileWriteError(writeTextFile): cannot write '{}'", path));
	}
}

} // namespace PixelForge::ImageIO
