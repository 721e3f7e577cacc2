/*
 * PixelForge Vectorizer Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Vectorizer/PathEmitter.hpp"

#include <iterator>

#include <fmt/format.h>

namespace PixelForge::Vectorizer {

namespace {

void appendPathCommands(fmt::memory_buffer &out, const Contour &contour)
{
	if (contour.empty())
		return;

	fmt::format_to(std::back_inserter(out), "M {} {}", contour.front().x, contour.front().y);
	for (std::size_t i = 1; i < contour.size(); ++i) {
		fmt::format_to(std::back_inserter(out), " L {} {}", contour[i].x, contour[i].y);
	}
	fmt::format_to(std::back_inserter(out), " Z");
}

} // anonymous namespace

void scaleContours(std::span<Contour> contours, double scale) noexcept
{
	for (Contour &contour : contours) {
		for (Imaging::PathPoint &p : contour) {
			p.x *= scale;
			p.y *= scale;
		}
	}
}

std::string toPathCommands(const Contour &contour)
{
	fmt::memory_buffer out;
	appendPathCommands(out, contour);
	return fmt::to_string(out);
}

std::string toPathData(std::span<const Contour> contours)
{
	fmt::memory_buffer out;
	for (const Contour &contour : contours) {
		if (contour.empty())
			continue;
		if (out.size() > 0)
			out.push_back(' ');
		appendPathCommands(out, contour);
	}
	return fmt::to_string(out);
}

std::string toSvgDocument(std::span<const Contour> contours, double width, double height,
			  std::string_view fillColor)
{
	fmt::memory_buffer out;
	fmt::format_to(std::back_inserter(out),
		       R"(<svg xmlns="http://www.w3.org/2000/svg" viewBox="0 0 {0} {1}" width="{0}" height="{1}">)",
		       width, height);

	for (const Contour &contour : contours) {
		if (contour.size() < 2)
			continue;
		fmt::format_to(std::back_inserter(out), R"(<path d=")");
		appendPathCommands(out, contour);
		fmt::format_to(std::back_inserter(out), R"(" fill="{}" fill-rule="evenodd"/>)", fillColor);
	}

	fmt::format_to(std::back_inserter(out), "</svg>");
	return fmt::to_string(out);
}

} // namespace PixelForge::Vectorizer
