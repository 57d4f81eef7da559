#include "toastkit/core/DataLoader.hh"
#include "toastkit/core/Log.hh"
#include "toastkit/ui/BgfxToastCanvas.hh"
#include "toastkit/ui/MonospaceFont.hh"
#include "toastkit/ui/ToastFactory.hh"
#include "toastkit/ui/ToastQueue.hh"
#include "toastkit/ui/ToastSettings.hh"
#include "toastkit/utils/Profiler.hh"

#include <bgfx/bgfx.h>
#include <bgfx/platform.h>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_properties.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char* kDefaultConfigPath = "assets/config/toast.toml";

bgfx::PlatformData getPlatformData(SDL_Window* window) {
    bgfx::PlatformData pd{};
    SDL_PropertiesID props = SDL_GetWindowProperties(window);

#if defined(SDL_PLATFORM_WIN32)
    pd.nwh = SDL_GetPointerProperty(props, SDL_PROP_WINDOW_WIN32_HWND_POINTER, nullptr);
#elif defined(SDL_PLATFORM_MACOS)
    pd.nwh = SDL_GetPointerProperty(props, SDL_PROP_WINDOW_COCOA_WINDOW_POINTER, nullptr);
#elif defined(SDL_PLATFORM_LINUX)
    void* wl = SDL_GetPointerProperty(props, SDL_PROP_WINDOW_WAYLAND_SURFACE_POINTER, nullptr);
    if (wl) {
        pd.ndt = SDL_GetPointerProperty(props, SDL_PROP_WINDOW_WAYLAND_DISPLAY_POINTER, nullptr);
        pd.nwh = wl;
        pd.type = bgfx::NativeWindowHandleType::Wayland;
    } else {
        pd.ndt = SDL_GetPointerProperty(props, SDL_PROP_WINDOW_X11_DISPLAY_POINTER, nullptr);
        pd.nwh = reinterpret_cast<void*>(
            static_cast<uintptr_t>(SDL_GetNumberProperty(props, SDL_PROP_WINDOW_X11_WINDOW_NUMBER, 0)));
    }
#endif

    return pd;
}

struct DemoConfig {
    std::string title = "Toastkit Demo";
    std::vector<std::string> messages = {"Hello from toastkit"};
    toastkit::ToastSettings settings;
};

// Missing or broken configuration falls back to defaults.
DemoConfig loadDemoConfig(const char* path) {
    DemoConfig config;

    auto loaded = toastkit::DataLoader::load(path);
    if (loaded.isError()) {
        TOASTKIT_LOG_WARN("Using default toast settings: {}", loaded.message());
        return config;
    }
    const auto& data = loaded.value();

    auto settings = toastkit::parseToastSettings(data);
    if (settings.isOk()) {
        config.settings = settings.value();
    } else {
        TOASTKIT_LOG_WARN("Ignoring [toast] settings: {}", settings.message());
    }

    auto title = data.getString("demo.title");
    if (title.isOk()) {
        config.title = title.value();
    }

    auto messages = data.getStringArray("demo.messages");
    if (messages.isOk() && !messages.value().empty()) {
        config.messages = std::move(messages.value());
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    toastkit::log::init();

    const char* configPath = argc > 1 ? argv[1] : kDefaultConfigPath;
    DemoConfig config = loadDemoConfig(configPath);

    try {
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            TOASTKIT_LOG_CRITICAL("SDL init failed: {}", SDL_GetError());
            toastkit::log::shutdown();
            return 1;
        }

        constexpr int kWindowWidth = 1280;
        constexpr int kWindowHeight = 720;

        SDL_Window* window = SDL_CreateWindow(config.title.c_str(), kWindowWidth, kWindowHeight,
                                              SDL_WINDOW_HIGH_PIXEL_DENSITY | SDL_WINDOW_RESIZABLE);

        if (!window) {
            TOASTKIT_LOG_CRITICAL("Window creation failed: {}", SDL_GetError());
            SDL_Quit();
            toastkit::log::shutdown();
            return 1;
        }

        // Signal single-threaded rendering before bgfx::init.
        bgfx::renderFrame();

        int pw, ph;
        SDL_GetWindowSizeInPixels(window, &pw, &ph);

        bgfx::Init bgfxInit;
        bgfxInit.type = bgfx::RendererType::Count;
        bgfxInit.platformData = getPlatformData(window);
        bgfxInit.resolution.width = static_cast<uint32_t>(pw);
        bgfxInit.resolution.height = static_cast<uint32_t>(ph);
        bgfxInit.resolution.reset = BGFX_RESET_VSYNC;

        if (!bgfx::init(bgfxInit)) {
            TOASTKIT_LOG_CRITICAL("bgfx init failed");
            SDL_DestroyWindow(window);
            SDL_Quit();
            toastkit::log::shutdown();
            return 1;
        }

        bgfx::setDebug(BGFX_DEBUG_TEXT);
        bgfx::setViewClear(0, BGFX_CLEAR_COLOR | BGFX_CLEAR_DEPTH, 0x303030ff, 1.0f, 0);
        bgfx::setViewRect(0, 0, 0, static_cast<uint16_t>(pw), static_cast<uint16_t>(ph));

        TOASTKIT_LOG_INFO("bgfx renderer: {}", bgfx::getRendererName(bgfx::getRendererType()));

        toastkit::BgfxToastCanvas canvas;
        canvas.init();

        auto viewport = [window]() {
            int w = 0, h = 0;
            SDL_GetWindowSizeInPixels(window, &w, &h);
            return toastkit::ViewportSize{static_cast<float>(w), static_cast<float>(h)};
        };

        auto font = std::make_shared<toastkit::MonospaceFont>(toastkit::MonospaceFont::debugText());
        toastkit::ToastFactory factory =
            toastkit::ToastFactory::Builder(viewport).font(font).settings(config.settings).build();

        toastkit::ToastQueue queue;
        std::size_t nextMessage = 0;
        auto showNext = [&]() {
            const auto& text = config.messages[nextMessage % config.messages.size()];
            auto length = nextMessage % 2 == 0 ? toastkit::ToastLength::Short : toastkit::ToastLength::Long;
            queue.show(factory.create(text, length));
            ++nextMessage;
        };
        showNext();

        TOASTKIT_LOG_INFO("Entering main loop (space queues a toast, escape quits)");

        auto lastTime = std::chrono::high_resolution_clock::now();
        bool running = true;
        while (running) {
            TOASTKIT_ZONE_SCOPED_N("main_loop");

            auto now = std::chrono::high_resolution_clock::now();
            float dt = std::chrono::duration<float>(now - lastTime).count();
            lastTime = now;

            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                if (event.type == SDL_EVENT_QUIT)
                    running = false;

                if (event.type == SDL_EVENT_KEY_DOWN && !event.key.repeat) {
                    if (event.key.key == SDLK_ESCAPE)
                        running = false;
                    else if (event.key.key == SDLK_SPACE)
                        showNext();
                }

                if (event.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED) {
                    auto w = static_cast<uint32_t>(event.window.data1);
                    auto h = static_cast<uint32_t>(event.window.data2);
                    if (w == 0 || h == 0)
                        continue;
                    bgfx::reset(w, h, BGFX_RESET_VSYNC);
                    bgfx::setViewRect(0, 0, 0, static_cast<uint16_t>(w), static_cast<uint16_t>(h));
                }
            }

            int curW, curH;
            SDL_GetWindowSizeInPixels(window, &curW, &curH);
            bgfx::touch(0);

            canvas.beginFrame(static_cast<uint16_t>(curW), static_cast<uint16_t>(curH));
            queue.update(dt, canvas);

            bgfx::frame();

            TOASTKIT_FRAME_MARK;
        }

        TOASTKIT_LOG_INFO("Shutting down");

        queue.clear();
        canvas.shutdown();
        bgfx::shutdown();
        SDL_DestroyWindow(window);
        SDL_Quit();
        toastkit::log::shutdown();

        return 0;

    } catch (const std::exception& e) {
        TOASTKIT_LOG_ERROR("Fatal: {}", e.what());
        toastkit::log::shutdown();
        return 1;
    }
}
