/*
 * PixelForge Logger Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdio>
#include <iterator>
#include <source_location>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "ILogger.hpp"

namespace PixelForge::Logger {

/**
 * @brief Writes one line per record to stderr, dropping records below the minimum level.
 */
class ConsoleLogger final : public ILogger {
public:
	explicit ConsoleLogger(std::string_view prefix, LogLevel minimumLevel = LogLevel::Info) noexcept
		: prefix_(prefix),
		  minimumLevel_(minimumLevel)
	{
	}

	~ConsoleLogger() override = default;

	LogLevel minimumLevel() const noexcept { return minimumLevel_; }

protected:
	void log(LogLevel level, std::string_view message) const noexcept override
	{
		if (level < minimumLevel_) {
			return;
		}

		try {
			fmt::print(stderr, "[{}] {} {}\n", toString(level), prefix_, message);
		} catch (...) {
			std::fputs("[ERROR] LOGGER PANIC OCCURRED\n", stderr);
		}
	}

	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		if (level < minimumLevel_) {
			return;
		}

		try {
			fmt::basic_memory_buffer<char, 1024> buffer;

			fmt::format_to(std::back_inserter(buffer), "[{}] {} name={}\tlocation={}:{}", toString(level),
				       prefix_, name, loc.file_name(), loc.line());
			for (const LogField &field : context) {
				fmt::format_to(std::back_inserter(buffer), "\t{}={}", field.key, field.value);
			}

			fmt::print(stderr, "{}\n", std::string_view(buffer.data(), buffer.size()));
		} catch (...) {
			std::fprintf(stderr, "[ERROR] %.*s name=LoggerPanic\n", static_cast<int>(prefix_.size()),
				     prefix_.data());
		}
	}

private:
	const std::string_view prefix_;
	const LogLevel minimumLevel_;
};

} // namespace PixelForge::Logger
