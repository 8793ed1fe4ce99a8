#include "bsk_platform/platform.h"

#include "bsk/log.h"

#include <SDL3/SDL.h>
#include <cstdlib>
#include <dlfcn.h>
#include <string>
#include <vector>

namespace bsk::platform::detail {

KeyCode map_sdl_scancode(SDL_Scancode scancode) {
  switch (scancode) {
    case SDL_SCANCODE_ESCAPE:
      return KeyCode::Escape;
    case SDL_SCANCODE_SPACE:
      return KeyCode::Space;
    case SDL_SCANCODE_F1:
      return KeyCode::F1;
    case SDL_SCANCODE_F5:
      return KeyCode::F5;
    default:
      return KeyCode::Unknown;
  }
}

namespace {

std::string env_or_empty(const char* name) {
  const char* v = std::getenv(name);
  return v ? v : "";
}

std::string sdl_error_text() {
  const char* e = SDL_GetError();
  return (e && *e) ? e : "unknown error";
}

bool library_loadable(const char* soname) {
  void* handle = dlopen(soname, RTLD_LAZY | RTLD_LOCAL);
  if (!handle) return false;
  dlclose(handle);
  return true;
}

// Video drivers to try in order. An explicit SDL_VIDEODRIVER goes first;
// SDL's own default ("") follows, then whatever display servers the session
// advertises, then headless drivers.
std::vector<std::string> candidate_drivers() {
  std::vector<std::string> out;
  const std::string forced = env_or_empty("SDL_VIDEODRIVER");
  if (!forced.empty()) out.push_back(forced);
  out.push_back("");

  const bool wayland = !env_or_empty("WAYLAND_DISPLAY").empty() && !env_or_empty("XDG_RUNTIME_DIR").empty();
  const bool x11 = !env_or_empty("DISPLAY").empty();
  if (wayland) {
    if (library_loadable("libwayland-client.so.0")) {
      out.push_back("wayland");
    } else {
      bsk::log::warn("WAYLAND_DISPLAY set but libwayland-client.so.0 cannot be loaded");
    }
  }
  if (x11) {
    if (library_loadable("libX11.so.6")) {
      out.push_back("x11");
    } else {
      bsk::log::warn("DISPLAY set but libX11.so.6 cannot be loaded");
    }
  }
  if (!wayland && !x11) {
    out.push_back("kmsdrm");
    out.push_back("offscreen");
  }
  return out;
}

bool open_window(const WindowDesc& desc, SDL_Window*& window, SDL_Renderer*& renderer, std::string& err) {
  if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
    err = sdl_error_text();
    return false;
  }
  window = SDL_CreateWindow(desc.title, desc.width, desc.height, SDL_WINDOW_RESIZABLE);
  if (!window) {
    err = "window: " + sdl_error_text();
    SDL_Quit();
    return false;
  }
  renderer = SDL_CreateRenderer(window, nullptr);
  if (!renderer) {
    err = "renderer: " + sdl_error_text();
    SDL_DestroyWindow(window);
    window = nullptr;
    SDL_Quit();
    return false;
  }
  return true;
}

} // namespace

bool platform_init(Platform* self, const WindowDesc& desc) {
  std::vector<std::string> failures;
  for (const std::string& driver : candidate_drivers()) {
    if (driver.empty()) {
      unsetenv("SDL_VIDEODRIVER");
    } else {
      setenv("SDL_VIDEODRIVER", driver.c_str(), 1);
    }
    SDL_ClearError();
    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    std::string err;
    if (!open_window(desc, window, renderer, err)) {
      failures.push_back((driver.empty() ? std::string("(default)") : driver) + ": " + err);
      continue;
    }
    if (!failures.empty()) {
      bsk::log::warn("SDL video came up on driver " + (driver.empty() ? std::string("(default)") : driver));
    }
    self->window_ = window;
    self->renderer_ = renderer;
    self->width_ = desc.width;
    self->height_ = desc.height;
    self->mouse_ = {desc.width * 0.5f, desc.height * 0.5f};
    self->last_ticks_ = SDL_GetTicks();
    self->quit_ = false;
    return true;
  }

  bsk::log::error("no SDL video driver could open a window");
  for (const auto& f : failures) {
    bsk::log::error("  " + f);
  }
  const int driver_count = SDL_GetNumVideoDrivers();
  std::string compiled;
  for (int i = 0; i < driver_count; ++i) {
    if (const char* name = SDL_GetVideoDriver(i)) {
      compiled += compiled.empty() ? name : std::string(", ") + name;
    }
  }
  bsk::log::error("compiled-in drivers: " + (compiled.empty() ? std::string("none") : compiled));
  bsk::log::error("DISPLAY=" + env_or_empty("DISPLAY") + " WAYLAND_DISPLAY=" + env_or_empty("WAYLAND_DISPLAY") +
                  " XDG_RUNTIME_DIR=" + env_or_empty("XDG_RUNTIME_DIR"));
  return false;
}

void platform_shutdown(Platform* self) {
  if (self->renderer_) {
    SDL_DestroyRenderer(static_cast<SDL_Renderer*>(self->renderer_));
    self->renderer_ = nullptr;
  }
  if (self->window_) {
    SDL_DestroyWindow(static_cast<SDL_Window*>(self->window_));
    self->window_ = nullptr;
  }
  SDL_Quit();
}

void platform_poll_events(Platform* self) {
  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        self->quit_ = true;
        break;
      case SDL_EVENT_WINDOW_RESIZED:
        self->width_ = event.window.data1;
        self->height_ = event.window.data2;
        break;
      case SDL_EVENT_MOUSE_MOTION:
        self->mouse_ = {event.motion.x, event.motion.y};
        break;
      case SDL_EVENT_KEY_DOWN: {
        const auto code = map_sdl_scancode(event.key.scancode);
        if (code == KeyCode::Unknown) break;
        if (!event.key.repeat) {
          self->keys_pressed_.insert(code);
        }
        self->keys_down_.insert(code);
        if (code == KeyCode::Escape) {
          self->quit_ = true;
        }
        break;
      }
      case SDL_EVENT_KEY_UP: {
        const auto code = map_sdl_scancode(event.key.scancode);
        if (code != KeyCode::Unknown) {
          self->keys_down_.erase(code);
        }
        break;
      }
      default:
        break;
    }
  }
}

float platform_delta_seconds(Platform* self) {
  const auto now = SDL_GetTicks();
  const auto diff = now - self->last_ticks_;
  self->last_ticks_ = now;
  return static_cast<float>(diff) / 1000.0f;
}

void platform_begin_frame(Platform* self, const Color& clear) {
  auto* renderer = static_cast<SDL_Renderer*>(self->renderer_);
  if (!renderer) return;
  SDL_SetRenderDrawColor(renderer, clear.r, clear.g, clear.b, clear.a);
  SDL_RenderClear(renderer);
}

void platform_draw_lines(Platform* self, const std::vector<Segment>& segments, const Color& color) {
  auto* renderer = static_cast<SDL_Renderer*>(self->renderer_);
  if (!renderer) return;
  SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
  for (const auto& s : segments) {
    SDL_RenderLine(renderer, s.p0.x, s.p0.y, s.p1.x, s.p1.y);
  }
}

void platform_present(Platform* self) {
  auto* renderer = static_cast<SDL_Renderer*>(self->renderer_);
  if (!renderer) return;
  SDL_RenderPresent(renderer);
}

} // namespace bsk::platform::detail
