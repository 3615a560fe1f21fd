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

#include "scene_renderer.h"

#include <nlohmann/json.hpp>
#include <optional>

namespace vantage {

/**
 * @brief Writes a scene as a JSON document
 *
 * Output:
 *
 *   canvas          {width, height}
 *   content_bounds  {min: [x, y], max: [x, y]}
 *   stats           {total, horizontal, vertical, boundary}
 *   panels          [{label, kind, boundary_polygon: [[x, y]...],
 *                     lines: [{start, end, axis, boundary}...]}]
 *   config          echo of the generating config (when supplied)
 */
class JsonSceneExporter : public ISceneRenderer {
  public:
    JsonSceneExporter() = default;
    explicit JsonSceneExporter(SceneConfig config, int indent = 2);

    void render(const SceneGrid& scene, const std::string& output_path) const override;

    const char* format_name() const override {
        return "json";
    }

    nlohmann::json to_json(const SceneGrid& scene) const;

  private:
    std::optional<SceneConfig> config_;
    int indent_ = 2;
};

} // namespace vantage
