// hubdrive GUI - remote control surface for a motorized hub
// Uses Dear ImGui with SDL2 + OpenGL 2.1 for maximum compatibility

#include "app.hpp"

#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include <SDL.h>
#include <SDL_opengl.h>

#include <cstdio>
#include <string>
#include <hubdrive/logging.hpp>

namespace {

void printUsage(const char* prog) {
    std::printf("Usage: %s [options]\n", prog);
    std::printf("  --config, -c <path>  Settings file (default: $HUBDRIVE_CONFIG or ~/.config/hubdrive/settings.ini)\n");
    std::printf("  --sim                Offer the simulated hub in the device list\n");
    std::printf("  --software, -sw      Use the SDL renderer instead of OpenGL\n");
    std::printf("  --opengl, --gl       Force the OpenGL renderer\n");
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    hubdrive::gui::App::Options opts;
    bool force_software_renderer = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--sim" || arg == "-sim") {
            opts.enable_sim = true;
        } else if (arg == "--software" || arg == "-sw") {
            force_software_renderer = true;
        } else if (arg == "--opengl" || arg == "--gl") {
            force_software_renderer = false;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                opts.config_path = argv[++i];
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    // Initialize SDL
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        const char* sdl_err = SDL_GetError();
        std::fprintf(stderr, "Error: SDL_Init failed: %s\n", sdl_err ? sdl_err : "<unknown>");
        return 1;
    }

    SDL_Window* window = nullptr;
    SDL_GLContext gl_context = nullptr;
    SDL_Renderer* sdl_renderer = nullptr;
    bool using_software_renderer = force_software_renderer;

    auto failStartup = [&](const std::string& msg) -> int {
        std::fprintf(stderr, "Error: %s\n", msg.c_str());
        if (sdl_renderer) {
            SDL_DestroyRenderer(sdl_renderer);
            sdl_renderer = nullptr;
        }
        if (gl_context) {
            SDL_GL_DeleteContext(gl_context);
            gl_context = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        SDL_Quit();
        return 1;
    };

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    if (!using_software_renderer) {
        // Setup OpenGL 2.1 context (works on old hardware if driver is stable)
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
        SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
        SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 2);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 1);
        window_flags = (SDL_WindowFlags)(window_flags | SDL_WINDOW_OPENGL);
    }

    window = SDL_CreateWindow(
        "hubdrive - Hub Remote Control",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        440, 640,
        window_flags
    );

    if (!window) {
        const char* sdl_err = SDL_GetError();
        return failStartup(std::string("SDL_CreateWindow failed: ") + (sdl_err ? sdl_err : "<unknown>"));
    }

    if (using_software_renderer) {
        sdl_renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!sdl_renderer) {
            std::fprintf(stderr, "Accelerated SDL renderer unavailable (%s), using software\n", SDL_GetError());
            sdl_renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!sdl_renderer) {
            const char* sdl_err = SDL_GetError();
            return failStartup(std::string("SDL_CreateRenderer failed: ") + (sdl_err ? sdl_err : "<unknown>"));
        }
    } else {
        gl_context = SDL_GL_CreateContext(window);
        if (!gl_context) {
            const char* sdl_err = SDL_GetError();
            return failStartup(std::string("SDL_GL_CreateContext failed: ") + (sdl_err ? sdl_err : "<unknown>"));
        }
        if (SDL_GL_MakeCurrent(window, gl_context) != 0) {
            const char* sdl_err = SDL_GetError();
            return failStartup(std::string("SDL_GL_MakeCurrent failed: ") + (sdl_err ? sdl_err : "<unknown>"));
        }
        if (SDL_GL_SetSwapInterval(1) != 0) {
            // Non-fatal on some drivers
            std::fprintf(stderr, "SDL_GL_SetSwapInterval failed: %s\n", SDL_GetError());
        }
    }

    // Setup Dear ImGui context. Keyboard navigation stays off: arrows,
    // Enter and Space are drive keys.
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;

    // Setup style - dark theme
    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 4.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;

    // Setup Platform/Renderer backends
    if (using_software_renderer) {
        if (!ImGui_ImplSDL2_InitForSDLRenderer(window, sdl_renderer)) {
            return failStartup("ImGui_ImplSDL2_InitForSDLRenderer failed");
        }
        if (!ImGui_ImplSDLRenderer2_Init(sdl_renderer)) {
            return failStartup("ImGui_ImplSDLRenderer2_Init failed");
        }
    } else {
        if (!ImGui_ImplSDL2_InitForOpenGL(window, gl_context)) {
            return failStartup("ImGui_ImplSDL2_InitForOpenGL failed");
        }
        if (!ImGui_ImplOpenGL2_Init()) {
            return failStartup("ImGui_ImplOpenGL2_Init failed");
        }
    }

    {
        // App owns the session thread; it must be gone before ImGui shuts down
        hubdrive::gui::App app(opts);
        LOG_GUI(INFO, "Renderer: %s", using_software_renderer ? "SDL" : "OpenGL 2.1");

        bool running = true;
        while (running) {
            // Poll events
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);

                if (event.type == SDL_QUIT) {
                    running = false;
                }
                if (event.type == SDL_WINDOWEVENT &&
                    event.window.event == SDL_WINDOWEVENT_CLOSE &&
                    event.window.windowID == SDL_GetWindowID(window)) {
                    running = false;
                }
            }

            // Start ImGui frame
            if (using_software_renderer) {
                ImGui_ImplSDLRenderer2_NewFrame();
                ImGui_ImplSDL2_NewFrame();
            } else {
                ImGui_ImplOpenGL2_NewFrame();
                ImGui_ImplSDL2_NewFrame();
            }
            ImGui::NewFrame();

            app.render();

            // Rendering
            ImGui::Render();
            if (using_software_renderer) {
                SDL_SetRenderDrawColor(sdl_renderer, 26, 26, 31, 255);
                SDL_RenderClear(sdl_renderer);
                ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), sdl_renderer);
                SDL_RenderPresent(sdl_renderer);
            } else {
                glViewport(0, 0, (int)io.DisplaySize.x, (int)io.DisplaySize.y);
                glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
                glClear(GL_COLOR_BUFFER_BIT);
                ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());
                SDL_GL_SwapWindow(window);
            }
        }
    }

    // Cleanup
    if (using_software_renderer) {
        ImGui_ImplSDLRenderer2_Shutdown();
    } else {
        ImGui_ImplOpenGL2_Shutdown();
    }
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    if (sdl_renderer) {
        SDL_DestroyRenderer(sdl_renderer);
        sdl_renderer = nullptr;
    }
    if (gl_context) {
        SDL_GL_DeleteContext(gl_context);
        gl_context = nullptr;
    }
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}
