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

#include "grid_error.h"

namespace vantage {

const char* grid_error_type_name(GridErrorType type) {
    switch (type) {
    case GridErrorType::INVALID_CAMERA_CONFIG:
        return "InvalidCameraConfig";
    case GridErrorType::DEGENERATE_BASIS:
        return "DegenerateBasis";
    case GridErrorType::INVALID_LAYOUT_DIMENSIONS:
        return "InvalidLayoutDimensions";
    case GridErrorType::INVALID_DENSITY:
        return "InvalidDensity";
    case GridErrorType::SINGULAR_MATRIX:
        return "SingularMatrix";
    case GridErrorType::INVALID_CONFIG:
        return "InvalidConfig";
    case GridErrorType::RENDER_FAILED:
        return "RenderFailed";
    }
    return "Unknown";
}

} // namespace vantage
