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

#include "scene_config.h"

#include "grid_error.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace vantage {

namespace {

[[noreturn]] void config_error(const std::string& key, const std::string& message) {
    throw GridError(GridErrorType::INVALID_CONFIG, "Config key '" + key + "': " + message, key);
}

const json* find_key(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

const json* find_object(const json& obj, const char* key, const std::string& path) {
    const json* value = find_key(obj, key);
    if (value && !value->is_object()) {
        config_error(path, "expected an object");
    }
    return value;
}

double read_number(const json& obj, const char* key, const std::string& path, double fallback) {
    const json* value = find_key(obj, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number()) {
        config_error(path, "expected a number, got " + std::string(value->type_name()));
    }
    return value->get<double>();
}

// Reads through int64 so values outside int are rejected instead of narrowed
int read_positive_int(const json& obj, const char* key, const std::string& path, int fallback) {
    const json* value = find_key(obj, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number_integer()) {
        config_error(path, "expected an integer, got " + std::string(value->type_name()));
    }
    if (value->is_number_unsigned() &&
        value->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        config_error(path, "must be between 1 and " +
                               std::to_string(std::numeric_limits<int>::max()));
    }
    std::int64_t raw = value->get<std::int64_t>();
    if (raw < 1 || raw > std::numeric_limits<int>::max()) {
        config_error(path, "must be between 1 and " +
                               std::to_string(std::numeric_limits<int>::max()) + ", got " +
                               std::to_string(raw));
    }
    return static_cast<int>(raw);
}

std::string read_string(const json& obj, const char* key, const std::string& path,
                        const std::string& fallback) {
    const json* value = find_key(obj, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        config_error(path, "expected a string, got " + std::string(value->type_name()));
    }
    return value->get<std::string>();
}

Vec3 read_vec3(const json& obj, const char* key, const std::string& path, const Vec3& fallback) {
    const json* value = find_key(obj, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_array() || value->size() != 3) {
        config_error(path, "expected an array of 3 numbers");
    }
    Vec3 result;
    for (size_t i = 0; i < 3; ++i) {
        const json& component = (*value)[i];
        if (!component.is_number()) {
            config_error(path + "[" + std::to_string(i) + "]", "expected a number");
        }
        result[static_cast<int>(i)] = component.get<double>();
    }
    return result;
}

LengthUnit read_unit(const json& obj, const std::string& path, LengthUnit fallback) {
    std::string name = read_string(obj, "units", path + ".units", length_unit_name(fallback));
    auto unit = parse_length_unit(name);
    if (!unit) {
        config_error(path + ".units", "unknown unit '" + name + "'");
    }
    return *unit;
}

void read_layout(const json& layout, SceneConfig& config) {
    std::string type = read_string(layout, "type", "layout.type", "3panel");
    auto kind = parse_layout_kind(type);
    if (!kind) {
        config_error("layout.type", "unknown layout '" + type + "'");
    }
    config.layout_kind = *kind;

    LengthUnit panel_units = LengthUnit::INCHES;
    if (const json* size = find_key(layout, "panel_size")) {
        if (size->is_string()) {
            auto preset = panel_size_preset(size->get<std::string>());
            if (!preset) {
                config_error("layout.panel_size",
                             "unknown preset '" + size->get<std::string>() + "'");
            }
            config.panel_width = (*preset)[0];
            config.panel_height = (*preset)[1];
        } else if (size->is_object()) {
            config.panel_width =
                read_number(*size, "width", "layout.panel_size.width", config.panel_width);
            config.panel_height =
                read_number(*size, "height", "layout.panel_size.height", config.panel_height);
            panel_units = read_unit(*size, "layout.panel_size", LengthUnit::INCHES);
        } else {
            config_error("layout.panel_size", "expected an object or preset name");
        }
    }

    if (const json* room = find_key(layout, "room_size")) {
        RoomScale scale;
        if (room->is_string()) {
            auto preset = room_size_preset(room->get<std::string>());
            if (!preset) {
                config_error("layout.room_size", "unknown preset '" + room->get<std::string>() + "'");
            }
            scale = *preset;
        } else if (room->is_object()) {
            scale.width = read_number(*room, "width", "layout.room_size.width", 0.0);
            scale.height = read_number(*room, "height", "layout.room_size.height", 0.0);
            scale.depth = read_number(*room, "depth", "layout.room_size.depth", scale.width);
            scale.room_units = read_unit(*room, "layout.room_size", LengthUnit::FEET);
        } else {
            config_error("layout.room_size", "expected an object or preset name");
        }
        scale.panel_units = panel_units;
        config.room_scale = scale;
    }

    if (const json* overrides = find_object(layout, "density_overrides", "layout.density_overrides")) {
        for (auto it = overrides->begin(); it != overrides->end(); ++it) {
            std::string path = "layout.density_overrides." + it.key();
            if (!it->is_number()) {
                config_error(path, "expected a number");
            }
            config.panel_density_overrides[it.key()] = it->get<double>();
        }
    }
}

void read_camera(const json& camera, SceneConfig& config) {
    config.camera_position =
        read_vec3(camera, "position", "camera.position", config.camera_position);
    config.camera_target = read_vec3(camera, "target", "camera.target", config.camera_target);
    config.camera_up = read_vec3(camera, "up", "camera.up", config.camera_up);
    config.fov_degrees = read_number(camera, "fov", "camera.fov", DEFAULT_FOV_DEGREES);
    config.near_plane = read_number(camera, "near", "camera.near", DEFAULT_NEAR_PLANE);
    config.far_plane = read_number(camera, "far", "camera.far", DEFAULT_FAR_PLANE);

    std::string projection = read_string(camera, "projection", "camera.projection", "perspective");
    auto mode = parse_projection_mode(projection);
    if (!mode) {
        config_error("camera.projection", "unknown projection '" + projection + "'");
    }
    config.projection_mode = *mode;
}

} // anonymous namespace

std::optional<ProjectionMode> parse_projection_mode(const std::string& str) {
    if (str == "perspective") {
        return ProjectionMode::PERSPECTIVE;
    }
    if (str == "orthographic" || str == "ortho") {
        return ProjectionMode::ORTHOGRAPHIC;
    }
    return std::nullopt;
}

SceneConfig scene_config_from_json(const json& doc) {
    if (!doc.is_object()) {
        config_error("<root>", "expected an object");
    }

    SceneConfig config;
    config.grid_density = DEFAULT_GRID_DENSITY;
    config.min_line_length = DEFAULT_MIN_LINE_LENGTH;
    config.canvas_width = DEFAULT_CANVAS_WIDTH;
    config.canvas_height = DEFAULT_CANVAS_HEIGHT;

    config.preset_name = read_string(doc, "preset_name", "preset_name", "");

    if (const json* layout = find_object(doc, "layout", "layout")) {
        read_layout(*layout, config);
    }
    if (const json* camera = find_object(doc, "camera", "camera")) {
        read_camera(*camera, config);
    }
    if (const json* grid = find_object(doc, "grid", "grid")) {
        config.grid_density = read_number(*grid, "density", "grid.density", DEFAULT_GRID_DENSITY);
        config.min_line_length =
            read_number(*grid, "min_line_length", "grid.min_line_length", DEFAULT_MIN_LINE_LENGTH);
    }
    if (const json* output = find_object(doc, "output", "output")) {
        if (const json* size = find_object(*output, "size", "output.size")) {
            config.canvas_width =
                read_positive_int(*size, "width", "output.size.width", DEFAULT_CANVAS_WIDTH);
            config.canvas_height =
                read_positive_int(*size, "height", "output.size.height", DEFAULT_CANVAS_HEIGHT);
        }
    }

    spdlog::debug("[Config] Loaded '{}': {} {}x{}, density {:.3f}, canvas {}x{}",
                  config.preset_name, layout_kind_name(config.layout_kind), config.panel_width,
                  config.panel_height, config.grid_density, config.canvas_width,
                  config.canvas_height);
    return config;
}

SceneConfig load_scene_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GridError(GridErrorType::INVALID_CONFIG, "Cannot open config file: " + path, "path");
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw GridError(GridErrorType::INVALID_CONFIG,
                        "Invalid JSON in " + path + ": " + e.what(), "path");
    }

    spdlog::debug("[Config] Parsed {}", path);
    return scene_config_from_json(doc);
}

json scene_config_to_json(const SceneConfig& config) {
    json doc;
    if (!config.preset_name.empty()) {
        doc["preset_name"] = config.preset_name;
    }

    json& layout = doc["layout"];
    layout["type"] = layout_kind_name(config.layout_kind);
    layout["panel_size"] = {{"width", config.panel_width},
                            {"height", config.panel_height},
                            {"units", length_unit_name(config.room_scale
                                                           ? config.room_scale->panel_units
                                                           : LengthUnit::INCHES)}};
    if (config.room_scale) {
        const RoomScale& room = *config.room_scale;
        layout["room_size"] = {{"width", room.width},
                               {"height", room.height},
                               {"depth", room.depth},
                               {"units", length_unit_name(room.room_units)}};
    }
    if (!config.panel_density_overrides.empty()) {
        layout["density_overrides"] = config.panel_density_overrides;
    }

    auto vec = [](const Vec3& v) { return json::array({v.x, v.y, v.z}); };
    doc["camera"] = {{"position", vec(config.camera_position)},
                     {"target", vec(config.camera_target)},
                     {"up", vec(config.camera_up)},
                     {"fov", config.fov_degrees},
                     {"near", config.near_plane},
                     {"far", config.far_plane},
                     {"projection", projection_mode_name(config.projection_mode)}};
    doc["grid"] = {{"density", config.grid_density}, {"min_line_length", config.min_line_length}};
    doc["output"]["size"] = {{"width", config.canvas_width}, {"height", config.canvas_height}};
    return doc;
}

} // namespace vantage
