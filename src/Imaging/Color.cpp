/*
 * PixelForge Imaging Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PixelForge/Imaging/Color.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace PixelForge::Imaging {

namespace {

constexpr std::array<std::pair<std::string_view, Rgb>, 5> kNamedColors = {{
	{"white", {255, 255, 255}},
	{"black", {0, 0, 0}},
	{"red", {255, 0, 0}},
	{"green", {0, 128, 0}},
	{"blue", {0, 0, 255}},
}};

int hexDigit(char c) noexcept
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

std::string_view trim(std::string_view text) noexcept
{
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
		text.remove_prefix(1);
	while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
		text.remove_suffix(1);
	return text;
}

[[noreturn]] void throwInvalidColor(std::string_view text)
{
	throw std::invalid_argument(fmt::format("InvalidColor(parseColor): '{}'", text));
}

Rgb parseHex(std::string_view digits, std::string_view original)
{
	std::array<int, 6> values{};
	for (std::size_t i = 0; i < digits.size(); ++i) {
		values[i] = hexDigit(digits[i]);
		if (values[i] < 0) {
			throwInvalidColor(original);
		}
	}

	if (digits.size() == 3) {
		return {static_cast<std::uint8_t>(values[0] * 17), static_cast<std::uint8_t>(values[1] * 17),
			static_cast<std::uint8_t>(values[2] * 17)};
	}
	return {static_cast<std::uint8_t>(values[0] * 16 + values[1]),
		static_cast<std::uint8_t>(values[2] * 16 + values[3]),
		static_cast<std::uint8_t>(values[4] * 16 + values[5])};
}

Rgb parseFunctional(std::string_view body, std::string_view original)
{
	std::array<std::uint8_t, 3> channels{};
	for (std::size_t i = 0; i < channels.size(); ++i) {
		const std::size_t comma = body.find(',');
		const bool last = i + 1 == channels.size();
		if (last != (comma == std::string_view::npos)) {
			throwInvalidColor(original);
		}

		const std::string_view token = trim(last ? body : body.substr(0, comma));
		int value = -1;
		const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
		if (ec != std::errc() || ptr != token.data() + token.size() || value < 0 || value > 255) {
			throwInvalidColor(original);
		}
		channels[i] = static_cast<std::uint8_t>(value);

		if (!last) {
			body.remove_prefix(comma + 1);
		}
	}
	return {channels[0], channels[1], channels[2]};
}

} // anonymous namespace

Hsl rgbToHsl(Rgb color) noexcept
{
	const double r = color.r / 255.0;
	const double g = color.g / 255.0;
	const double b = color.b / 255.0;

	const double max = std::max({r, g, b});
	const double min = std::min({r, g, b});
	const double l = (max + min) / 2.0;

	if (max == min) {
		return {0.0, 0.0, l};
	}

	const double d = max - min;
	const double s = l > 0.5 ? d / (2.0 - max - min) : d / (max + min);

	double h;
	if (max == r) {
		h = (g - b) / d + (g < b ? 6.0 : 0.0);
	} else if (max == g) {
		h = (b - r) / d + 2.0;
	} else {
		h = (r - g) / d + 4.0;
	}

	return {h * 60.0, s, l};
}

double hueDistance(double a, double b) noexcept
{
	const double d = std::fmod(std::fabs(a - b), 360.0);
	return std::min(d, 360.0 - d);
}

Rgb parseColor(std::string_view text)
{
	const std::string_view value = trim(text);

	if (!value.empty() && value.front() == '#') {
		const std::string_view digits = value.substr(1);
		if (digits.size() != 3 && digits.size() != 6) {
			throwInvalidColor(text);
		}
		return parseHex(digits, text);
	}

	if (value.size() > 5 && value.substr(0, 4) == "rgb(" && value.back() == ')') {
		return parseFunctional(value.substr(4, value.size() - 5), text);
	}

	for (const auto &[name, rgb] : kNamedColors) {
		if (std::equal(name.begin(), name.end(), value.begin(), value.end(), [](char a, char b) {
			    return a == std::tolower(static_cast<unsigned char>(b));
		    })) {
			return rgb;
		}
	}

	throwInvalidColor(text);
}

std::string toHexString(Rgb color)
{
	return fmt::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
}

} // namespace PixelForge::Imaging
