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

#include "scene_assembler.h"

#include <string>

namespace vantage {

/**
 * @brief Output backend for a generated scene
 *
 * The engine only produces geometry; turning a SceneGrid into an artifact
 * (image, vector file, data dump) is up to an implementation of this
 * interface.
 */
class ISceneRenderer {
  public:
    virtual ~ISceneRenderer() = default;

    /**
     * @brief Write the scene to output_path
     * @throws GridError(RENDER_FAILED) if the artifact cannot be produced
     */
    virtual void render(const SceneGrid& scene, const std::string& output_path) const = 0;

    /// Short format name for logs, e.g. "json"
    virtual const char* format_name() const = 0;
};

} // namespace vantage
