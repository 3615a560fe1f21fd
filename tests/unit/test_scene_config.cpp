// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Vantage Contributors
 */

#include "grid_error.h"
#include "json_scene_exporter.h"
#include "scene_config.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace vantage;
using Catch::Approx;
using json = nlohmann::json;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

GridError config_error(const json& doc) {
    try {
        scene_config_from_json(doc);
    } catch (const GridError& e) {
        return e;
    }
    FAIL("Expected INVALID_CONFIG");
    return GridError(GridErrorType::INVALID_CONFIG, "unreachable");
}

} // namespace

TEST_CASE("Config - Full document", "[config]") {
    json doc = json::parse(R"({
        "preset_name": "test_config",
        "layout": {
            "type": "5panel",
            "panel_size": {"width": 8.0, "height": 6.0, "units": "inches"},
            "room_size": {"width": 12, "height": 8, "depth": 10, "units": "feet"},
            "density_overrides": {"Floor": 1.5}
        },
        "camera": {
            "position": [1, 5, 9], "target": [0, 1, 0], "up": [0, 1, 0],
            "fov": 60, "near": 0.5, "far": 50, "projection": "orthographic"
        },
        "grid": {"density": 0.75, "min_line_length": 2.5},
        "output": {"size": {"width": 1280, "height": 720}, "format": "svg"},
        "style": {"line_color": "#000000"}
    })");

    SceneConfig config = scene_config_from_json(doc);

    REQUIRE(config.preset_name == "test_config");
    REQUIRE(config.layout_kind == LayoutKind::FIVE_PANEL);
    REQUIRE(config.panel_width == 8.0);
    REQUIRE(config.panel_height == 6.0);
    REQUIRE(config.room_scale.has_value());
    REQUIRE(config.room_scale->depth == 10.0);
    REQUIRE(config.room_scale->room_units == LengthUnit::FEET);
    REQUIRE(config.room_scale->panel_units == LengthUnit::INCHES);
    REQUIRE(config.panel_density_overrides.at("Floor") == 1.5);

    REQUIRE(approx_equal(config.camera_position, Vec3(1.0, 5.0, 9.0)));
    REQUIRE(approx_equal(config.camera_target, Vec3(0.0, 1.0, 0.0)));
    REQUIRE(config.fov_degrees == 60.0);
    REQUIRE(config.near_plane == 0.5);
    REQUIRE(config.far_plane == 50.0);
    REQUIRE(config.projection_mode == ProjectionMode::ORTHOGRAPHIC);

    REQUIRE(config.grid_density == 0.75);
    REQUIRE(config.min_line_length == 2.5);
    REQUIRE(config.canvas_width == 1280);
    REQUIRE(config.canvas_height == 720);
}

TEST_CASE("Config - Defaults for missing keys", "[config]") {
    SceneConfig config = scene_config_from_json(json::object());

    REQUIRE(config.layout_kind == LayoutKind::THREE_PANEL);
    REQUIRE(config.panel_width == 6.0);
    REQUIRE(config.panel_height == 6.0);
    REQUIRE_FALSE(config.room_scale.has_value());
    REQUIRE(config.near_plane == DEFAULT_NEAR_PLANE);
    REQUIRE(config.far_plane == DEFAULT_FAR_PLANE);
    REQUIRE(config.fov_degrees == DEFAULT_FOV_DEGREES);
    REQUIRE(config.projection_mode == ProjectionMode::PERSPECTIVE);
    REQUIRE(approx_equal(config.camera_up, WORLD_UP));
    REQUIRE(config.grid_density == DEFAULT_GRID_DENSITY);
    REQUIRE(config.min_line_length == DEFAULT_MIN_LINE_LENGTH);
    REQUIRE(config.canvas_width == DEFAULT_CANVAS_WIDTH);
    REQUIRE(config.canvas_height == DEFAULT_CANVAS_HEIGHT);
}

TEST_CASE("Config - Presets", "[config]") {
    json doc = json::parse(R"({"layout": {"panel_size": "small", "room_size": "large"}})");
    SceneConfig config = scene_config_from_json(doc);

    REQUIRE(config.panel_width == 4.0);
    REQUIRE(config.panel_height == 4.0);
    REQUIRE(config.room_scale.has_value());
    REQUIRE(config.room_scale->width == 16.0);
    REQUIRE(config.room_scale->height == 10.0);

    SECTION("Unknown preset names the key") {
        GridError e = config_error(json::parse(R"({"layout": {"panel_size": "giant"}})"));
        REQUIRE(e.type() == GridErrorType::INVALID_CONFIG);
        REQUIRE(e.parameter() == "layout.panel_size");
    }
}

TEST_CASE("Config - Type errors name the key", "[config]") {
    SECTION("String where a number belongs") {
        GridError e = config_error(json::parse(R"({"grid": {"density": "high"}})"));
        REQUIRE(e.parameter() == "grid.density");
    }

    SECTION("Short position array") {
        GridError e = config_error(json::parse(R"({"camera": {"position": [0, 4]}})"));
        REQUIRE(e.parameter() == "camera.position");
    }

    SECTION("Unknown layout type") {
        GridError e = config_error(json::parse(R"({"layout": {"type": "7panel"}})"));
        REQUIRE(e.parameter() == "layout.type");
    }

    SECTION("Unknown projection") {
        GridError e = config_error(json::parse(R"({"camera": {"projection": "fisheye"}})"));
        REQUIRE(e.parameter() == "camera.projection");
    }

    SECTION("Non-integer canvas size") {
        GridError e = config_error(json::parse(R"({"output": {"size": {"width": 12.5}}})"));
        REQUIRE(e.parameter() == "output.size.width");
    }

    SECTION("Canvas width beyond int range is rejected, not wrapped") {
        GridError e =
            config_error(json::parse(R"({"output": {"size": {"width": 4294969216}}})"));
        REQUIRE(e.parameter() == "output.size.width");

        e = config_error(json::parse(R"({"output": {"size": {"height": 2147483648}}})"));
        REQUIRE(e.parameter() == "output.size.height");
    }

    SECTION("Non-positive canvas size") {
        GridError e = config_error(json::parse(R"({"output": {"size": {"height": 0}}})"));
        REQUIRE(e.parameter() == "output.size.height");

        e = config_error(json::parse(R"({"output": {"size": {"width": -640}}})"));
        REQUIRE(e.parameter() == "output.size.width");
    }

    SECTION("Section of the wrong type") {
        GridError e = config_error(json::parse(R"({"camera": [1, 2, 3]})"));
        REQUIRE(e.parameter() == "camera");
    }

    SECTION("Root is not an object") {
        GridError e = config_error(json::array());
        REQUIRE(e.type() == GridErrorType::INVALID_CONFIG);
    }
}

TEST_CASE("Config - Loading files", "[config]") {
    SECTION("Missing file") {
        try {
            load_scene_config(temp_path("vantage_does_not_exist.json"));
            FAIL("Expected INVALID_CONFIG");
        } catch (const GridError& e) {
            REQUIRE(e.type() == GridErrorType::INVALID_CONFIG);
            REQUIRE(e.parameter() == "path");
        }
    }

    SECTION("Malformed JSON") {
        std::string path = temp_path("vantage_malformed.json");
        {
            std::ofstream out(path);
            out << "{\"layout\": {\"type\": \"3panel\",";
        }
        REQUIRE_THROWS_AS(load_scene_config(path), GridError);
        std::remove(path.c_str());
    }

    SECTION("Valid file") {
        std::string path = temp_path("vantage_valid.json");
        {
            std::ofstream out(path);
            out << R"({"layout": {"type": "4panel"}, "grid": {"density": 1.0}})";
        }
        SceneConfig config = load_scene_config(path);
        REQUIRE(config.layout_kind == LayoutKind::FOUR_PANEL);
        REQUIRE(config.grid_density == 1.0);
        std::remove(path.c_str());
    }
}

TEST_CASE("Config - Serialized config loads back", "[config]") {
    SceneConfig original;
    original.layout_kind = LayoutKind::FOUR_PANEL;
    original.panel_width = 5.0;
    original.room_scale = room_size_preset("small");
    original.panel_density_overrides["Ceiling"] = 0.25;
    original.projection_mode = ProjectionMode::ORTHOGRAPHIC;

    SceneConfig loaded = scene_config_from_json(scene_config_to_json(original));

    REQUIRE(loaded.layout_kind == original.layout_kind);
    REQUIRE(loaded.panel_width == original.panel_width);
    REQUIRE(loaded.room_scale.has_value());
    REQUIRE(loaded.room_scale->width == 8.0);
    REQUIRE(loaded.panel_density_overrides.at("Ceiling") == 0.25);
    REQUIRE(loaded.projection_mode == ProjectionMode::ORTHOGRAPHIC);
}

TEST_CASE("Export - JSON scene document", "[export]") {
    SceneConfig config;
    config.min_line_length = 0.0;
    SceneGrid scene = generate_scene(config);
    JsonSceneExporter exporter(config);

    SECTION("Document structure") {
        json doc = exporter.to_json(scene);

        REQUIRE(doc["canvas"]["width"] == 1920.0);
        REQUIRE(doc["canvas"]["height"] == 1080.0);
        REQUIRE(doc["panels"].size() == 3);
        REQUIRE(doc["panels"][0]["label"] == "Floor");
        REQUIRE(doc["panels"][0]["kind"] == "floor");
        REQUIRE(doc["stats"]["total"].get<size_t>() == scene.total_lines());
        REQUIRE(doc["config"]["layout"]["type"] == "3panel");

        const json& first_line = doc["panels"][0]["lines"][0];
        REQUIRE(first_line["start"].size() == 2);
        REQUIRE(first_line["boundary"].get<bool>());
        REQUIRE((first_line["axis"] == "horizontal" || first_line["axis"] == "vertical"));
    }

    SECTION("Written file parses back") {
        std::string path = temp_path("vantage_export.json");
        exporter.render(scene, path);

        std::ifstream in(path);
        json doc = json::parse(in);
        REQUIRE(doc["panels"].size() == scene.panels.size());
        REQUIRE(doc["panels"][1]["lines"].size() == scene.panels[1].lines.size());
        std::remove(path.c_str());
    }

    SECTION("Unwritable path reports RENDER_FAILED") {
        try {
            exporter.render(scene, temp_path("no_such_dir/vantage_export.json"));
            FAIL("Expected RENDER_FAILED");
        } catch (const GridError& e) {
            REQUIRE(e.type() == GridErrorType::RENDER_FAILED);
        }
    }

    SECTION("Exporter without config omits the echo") {
        JsonSceneExporter bare;
        REQUIRE(std::string(bare.format_name()) == "json");
        REQUIRE_FALSE(bare.to_json(scene).contains("config"));
    }
}
