#include "core/config.hpp"
#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "lua/log_bindings.hpp"
#include "lua/lua_state.hpp"
#include "lua/map_bindings.hpp"
#include "map/tile_map.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

static void print_usage() {
    std::cout << "TileCore probe v0.1.0\n"
              << "Headless driver for the TileCore tile-map core\n\n"
              << "Usage:\n"
              << "  tilecore-probe [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Lua file defining the TileCore table\n"
              << "  --script <path>    Lua scenario run against the map\n"
              << "  --width <n>        Map width (overrides config)\n"
              << "  --height <n>       Map height (overrides config)\n"
              << "  --dump             Print the map after the script ran\n"
              << "  --help             Show this help message\n";
}

struct ProbeArgs {
    tc::fs::path config_file;
    tc::fs::path script_file;
    std::optional<tc::i32> width;
    std::optional<tc::i32> height;
    bool dump = false;
};

static std::optional<tc::i32> parse_dimension(const char* flag,
                                              const char* text) {
    char* end = nullptr;
    long val = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || val < 1 ||
        val > tc::MAX_MAP_DIMENSION) {
        std::cerr << "Invalid " << flag << " value: " << text << "\n";
        return std::nullopt;
    }
    return static_cast<tc::i32>(val);
}

static std::optional<ProbeArgs> parse_args(int argc, char* argv[]) {
    ProbeArgs args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--script") == 0 && i + 1 < argc) {
            args.script_file = argv[++i];
        } else if (std::strcmp(argv[i], "--width") == 0 && i + 1 < argc) {
            args.width = parse_dimension("--width", argv[++i]);
            if (!args.width) return std::nullopt;
        } else if (std::strcmp(argv[i], "--height") == 0 && i + 1 < argc) {
            args.height = parse_dimension("--height", argv[++i]);
            if (!args.height) return std::nullopt;
        } else if (std::strcmp(argv[i], "--dump") == 0) {
            args.dump = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

static char cell_glyph(const tc::map::Tile& tile) {
    if (tile.glyph != ' ') return tile.glyph;
    switch (tile.tile_type) {
    case tc::map::TileType::Wall: return '#';
    case tc::map::TileType::ShortWall: return '+';
    case tc::map::TileType::Water: return '~';
    case tc::map::TileType::Exit: return '>';
    case tc::map::TileType::Empty: break;
    }
    if (tile.left_wall != tc::map::Wall::Empty) return '|';
    if (tile.bottom_wall != tc::map::Wall::Empty) return '_';
    return '.';
}

static void dump_map(const tc::map::TileMap& map) {
    for (tc::i32 y = 0; y < map.height(); y++) {
        std::string row;
        row.reserve(static_cast<size_t>(map.width()));
        for (tc::i32 x = 0; x < map.width(); x++) {
            row += cell_glyph(map.at(x, y));
        }
        std::cout << row << "\n";
    }
}

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        return 1;
    }

    tc::Config config;
    if (!args->config_file.empty()) {
        // Console-only logging until the configured sinks are known.
        tc::log::init();
        tc::lua::ConfigLoader loader;
        auto loaded = loader.load_file(args->config_file);
        if (!loaded) {
            spdlog::error("Config [{}]: {}",
                          tc::error_kind_name(loaded.error().kind),
                          loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }

    try {
        tc::log::init(config.log_file, config.log_level);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to open log file " << config.log_file << ": "
                  << e.what() << "\n";
        return 1;
    }

    if (args->width) config.map_width = *args->width;
    if (args->height) config.map_height = *args->height;

    tc::map::TileMap map(config.map_width, config.map_height);
    spdlog::info("Map: {}x{}, fov {} radius {}{}", map.width(), map.height(),
                 tc::fov_mode_name(config.fov_mode), config.fov_radius,
                 config.crouching ? " (crouching)" : "");

    int exit_code = 0;
    if (!args->script_file.empty()) {
        tc::lua::LuaState state;
        state.set_tile_map(&map);
        state.set_config(&config);
        tc::lua::register_log_bindings(state);
        tc::lua::register_map_bindings(state);

        spdlog::info("Running script: {}", args->script_file.string());
        auto result = state.do_file(args->script_file);
        if (!result) {
            spdlog::error("Script [{}]: {}",
                          tc::error_kind_name(result.error().kind),
                          result.error().message);
            exit_code = 1;
        }
    }

    if (args->dump) {
        dump_map(map);
    }

    tc::log::shutdown();
    return exit_code;
}
