// Map declutter viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <map_loaders/debug_map.hpp>
#include <map_loaders/json_loader.hpp>
#include <map_placement/placement_manager.hpp>
#include <map_render/imgui_footprint.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <optional>
#include <string>

namespace {

struct Options {
    std::string scene_path;
    std::string config_path;
    std::string dump_layout_path;
    bool check = false;
};

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "usage: %s [--scene <file>] [--config <file>] [--dump-layout <file>] [--check]\n"
        "  --dump-layout and --check run without a window and use the heuristic text metrics.\n"
        "  --check exits with 2 when any element is forced or suppressed.\n",
        argv0);
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options out;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (arg == "--scene") {
            if (!value(out.scene_path)) return std::nullopt;
        } else if (arg == "--config") {
            if (!value(out.config_path)) return std::nullopt;
        } else if (arg == "--dump-layout") {
            if (!value(out.dump_layout_path)) return std::nullopt;
        } else if (arg == "--check") {
            out.check = true;
        } else {
            return std::nullopt;
        }
    }
    return out;
}

map_model::MapScene load_scene(const Options& options, const map_placement::FootprintEstimator& estimator) {
    if (!options.scene_path.empty()) {
        auto loaded = map_loaders::load_map_from_json_file(options.scene_path, estimator);
        if (loaded) return std::move(*loaded);
        spdlog::warn("scene {} not loaded, using the built-in debug map", options.scene_path);
        return map_loaders::generate_debug_map(estimator);
    }
    const char* scene_paths[] = { "data/example_map.json", "example_map.json" };
    for (const char* path : scene_paths) {
        auto loaded = map_loaders::load_map_from_json_file(path, estimator);
        if (loaded) return std::move(*loaded);
    }
    return map_loaders::generate_debug_map(estimator);
}

int run_headless(const Options& options, const map_placement::PlacementConfig& config) {
    const map_placement::HeuristicFootprintEstimator estimator;
    const map_model::MapScene scene = load_scene(options, estimator);
    const auto result = map_placement::resolve_layout(scene.elements, config,
        map_placement::obstacles_from_fixtures(scene.fixtures));

    if (!options.dump_layout_path.empty() && !map_loaders::write_layout_json_file(result, options.dump_layout_path))
        return 1;

    (void)fprintf(stderr, "[check] scene=\"%s\" elements=%zu placed=%zu forced=%zu suppressed=%zu\n",
        scene.name.c_str(), result.placements.size(), result.placed_count(),
        result.forced_count, result.suppressed_count);
    if (options.check && (result.forced_count > 0 || result.suppressed_count > 0)) return 2;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    const auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 1;
    }

    map_placement::PlacementConfig config = map_placement::default_placement_config();
    if (!options->config_path.empty()) {
        auto loaded = map_loaders::load_placement_config_from_json_file(options->config_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot load placement config %s\n", options->config_path.c_str());
            return 1;
        }
        config = std::move(*loaded);
    }

    if (options->check || !options->dump_layout_path.empty())
        return run_headless(*options, config);

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow("Map declutter", window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 19.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSerif.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSerif-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    // Text is measured with the live font, so the scene loads inside the first frame.
    const map_render::ImGuiFootprintEstimator estimator;
    std::optional<map_model::MapScene> scene;
    canvas::MapCanvas map_canvas;
    map_canvas.set_config(config);

    bool running = true;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        if (!scene) {
            scene = load_scene(*options, estimator);
            map_canvas.set_scene(&*scene);
        }

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::Begin("Map", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        const auto& layout = map_canvas.layout();
        ImGui::Text("%s | placed %zu  forced %zu  suppressed %zu  overlaps %zu | R re-resolve, B boxes, S ghosts, F fit",
            scene->name.c_str(), layout.placed_count(), layout.forced_count, layout.suppressed_count,
            map_canvas.overlaps().size());
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar);
            map_canvas.update_and_draw(canvas_size.x, canvas_size.y);
            ImGui::EndChild();
        }
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
