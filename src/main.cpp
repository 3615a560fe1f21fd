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
#include "json_scene_exporter.h"
#include "logging_init.h"
#include "runtime_config.h"
#include "scene_assembler.h"
#include "scene_config.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <spdlog/spdlog.h>

using namespace vantage;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_GRID_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* argv0) {
    printf("Usage: %s -c <config.json> [options]\n", argv0);
    printf("Options:\n");
    printf("  -c, --config <file>    Scene configuration (JSON, required)\n");
    printf("  -o, --output <file>    Export projected grid as JSON\n");
    printf("      --layout <type>    Override layout: 3panel, 4panel, 5panel\n");
    printf("      --density <value>  Override global grid density (> 0)\n");
    printf("      --ortho            Use orthographic projection\n");
    printf("  -j, --parallel         Process panels on worker threads\n");
    printf("  -v, -vv, -vvv          Log verbosity: info, debug, trace\n");
    printf("      --log-dest <dest>  Log destination: auto, console, file, syslog\n");
    printf("      --log-file <path>  Log file path (implies file logging for auto)\n");
    printf("  -h, --help             Show this help message\n");
}

void print_stats(const SceneConfig& config, const SceneGrid& scene) {
    GridStats stats = compute_grid_stats(scene);

    printf("%s (%s)\n", layout_display_name(config.layout_kind),
           projection_mode_name(config.projection_mode));
    printf("Canvas: %dx%d\n", config.canvas_width, config.canvas_height);
    printf("Lines: %zu total (%zu horizontal, %zu vertical, %zu boundary)\n", stats.total_lines,
           stats.horizontal_lines, stats.vertical_lines, stats.boundary_lines);
    for (const auto& panel : scene.panels) {
        printf("  %-12s %zu lines\n", panel.label.c_str(), stats.lines_per_panel[panel.label]);
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    RuntimeConfig runtime;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 < argc) {
                runtime.config_path = argv[++i];
            } else {
                printf("Error: -c/--config requires an argument\n");
                return EXIT_USAGE;
            }
        } else if (strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) {
            if (i + 1 < argc) {
                runtime.output_path = argv[++i];
            } else {
                printf("Error: -o/--output requires an argument\n");
                return EXIT_USAGE;
            }
        } else if (strcmp(argv[i], "--layout") == 0) {
            if (i + 1 < argc) {
                const char* layout_arg = argv[++i];
                runtime.layout = parse_layout_kind(layout_arg);
                if (!runtime.layout) {
                    printf("Unknown layout: %s\n", layout_arg);
                    printf("Available layouts: 3panel, 4panel, 5panel\n");
                    return EXIT_USAGE;
                }
            } else {
                printf("Error: --layout requires an argument\n");
                return EXIT_USAGE;
            }
        } else if (strcmp(argv[i], "--density") == 0) {
            if (i + 1 < argc) {
                const char* density_arg = argv[++i];
                char* end = nullptr;
                double density = strtod(density_arg, &end);
                if (end == density_arg || *end != '\0' || !std::isfinite(density)) {
                    printf("Error: invalid density: %s\n", density_arg);
                    return EXIT_USAGE;
                }
                // Range is checked by the engine, so a bad value reports INVALID_DENSITY
                runtime.grid_density = density;
            } else {
                printf("Error: --density requires an argument\n");
                return EXIT_USAGE;
            }
        } else if (strcmp(argv[i], "--ortho") == 0) {
            runtime.force_orthographic = true;
        } else if (strcmp(argv[i], "-j") == 0 || strcmp(argv[i], "--parallel") == 0) {
            runtime.parallel = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            runtime.verbosity = 1;
        } else if (strcmp(argv[i], "-vv") == 0) {
            runtime.verbosity = 2;
        } else if (strcmp(argv[i], "-vvv") == 0) {
            runtime.verbosity = 3;
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (i + 1 < argc) {
                const char* dest_arg = argv[++i];
                runtime.log_target = logging::parse_log_target(dest_arg);
                if (runtime.log_target == logging::LogTarget::Auto && strcmp(dest_arg, "auto") != 0) {
                    printf("Unknown log destination: %s\n", dest_arg);
                    printf("Available destinations: auto, console, file, syslog\n");
                    return EXIT_USAGE;
                }
            } else {
                printf("Error: --log-dest requires an argument\n");
                return EXIT_USAGE;
            }
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 < argc) {
                runtime.log_file = argv[++i];
            } else {
                printf("Error: --log-file requires an argument\n");
                return EXIT_USAGE;
            }
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return EXIT_OK;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return EXIT_USAGE;
        }
    }

    if (runtime.config_path.empty()) {
        printf("Error: a configuration file is required (-c/--config)\n");
        printf("Use --help for usage information\n");
        return EXIT_USAGE;
    }

    try {
        logging::init(runtime.log_config());

        SceneConfig config = load_scene_config(runtime.config_path);
        runtime.apply_to(config);

        spdlog::info("[Main] {} from {}", layout_display_name(config.layout_kind),
                     runtime.config_path);

        SceneGrid scene = generate_scene(config);
        print_stats(config, scene);

        if (runtime.should_export()) {
            JsonSceneExporter exporter(config);
            exporter.render(scene, runtime.output_path);
            spdlog::info("[Main] Exported {} to {}", exporter.format_name(), runtime.output_path);
        }
    } catch (const GridError& e) {
        spdlog::error("[Main] {} ({}): {}", grid_error_type_name(e.type()),
                      e.parameter().empty() ? "-" : e.parameter(), e.what());
        return EXIT_GRID_ERROR;
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "Error: logging setup failed: %s\n", e.what());
        return EXIT_USAGE;
    }

    return EXIT_OK;
}
