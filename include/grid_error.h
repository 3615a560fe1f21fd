// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Vantage Contributors
 *
 * This file is part of Vantage, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace vantage {

/**
 * @brief Categories of failure reported by the grid engine
 *
 * All of these are local validation failures. None of them is transient,
 * so callers should surface them rather than retry.
 */
enum class GridErrorType {
    INVALID_CAMERA_CONFIG,     ///< position == target, FOV outside (0,180), bad near/far
    DEGENERATE_BASIS,          ///< Camera forward direction parallel to the up hint
    INVALID_LAYOUT_DIMENSIONS, ///< Non-positive panel width/height/depth
    INVALID_DENSITY,           ///< Non-positive density, or one past the per-panel line limit
    SINGULAR_MATRIX,           ///< Inverse requested on a non-invertible matrix
    INVALID_CONFIG,            ///< Configuration document malformed or mistyped
    RENDER_FAILED              ///< Renderer could not produce its artifact
};

/**
 * @brief Typed engine failure
 *
 * Carries the error kind plus the name of the offending parameter so that
 * front-ends can report "which value was wrong" without parsing messages.
 */
class GridError : public std::runtime_error {
  public:
    GridError(GridErrorType type, const std::string& message, std::string parameter = {})
        : std::runtime_error(message), type_(type), parameter_(std::move(parameter)) {}

    GridErrorType type() const {
        return type_;
    }

    /// Name of the parameter that failed validation (may be empty)
    const std::string& parameter() const {
        return parameter_;
    }

  private:
    GridErrorType type_;
    std::string parameter_;
};

/**
 * @brief Get the canonical name of an error kind
 * @param type Error kind
 * @return Name such as "InvalidCameraConfig"
 */
const char* grid_error_type_name(GridErrorType type);

} // namespace vantage
