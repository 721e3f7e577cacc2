/*
 * PixelForge BackgroundRemoval Library
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>

#include <PixelForge/Imaging/PixelBuffer.hpp>

#include "RemovalOptions.hpp"

namespace PixelForge::BackgroundRemoval {

/**
 * @class IBackgroundClassifier
 * @brief Decides per pixel whether it is background and rewrites its alpha accordingly.
 *
 * apply() mutates the caller's buffer in place and returns the same reference. An
 * implementation validates its input before the first write, so a throwing call leaves
 * the buffer untouched.
 */
class IBackgroundClassifier {
protected:
	IBackgroundClassifier() = default;

public:
	virtual ~IBackgroundClassifier() = default;

	virtual RemovalMethod getMethod() const noexcept = 0;

	virtual Imaging::PixelBuffer &apply(Imaging::PixelBuffer &buffer) const = 0;

	IBackgroundClassifier(const IBackgroundClassifier &) = delete;
	IBackgroundClassifier &operator=(const IBackgroundClassifier &) = delete;
	IBackgroundClassifier(IBackgroundClassifier &&) = delete;
	IBackgroundClassifier &operator=(IBackgroundClassifier &&) = delete;
};

std::unique_ptr<IBackgroundClassifier> makeClassifier(RemovalMethod method, const RemovalOptions &options);

} // namespace PixelForge::BackgroundRemoval
