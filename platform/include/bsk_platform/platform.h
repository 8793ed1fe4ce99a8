#pragma once

#include "bsk/marching_squares.h"
#include "bsk/math.h"

#include <cstdint>
#include <unordered_set>
#include <vector>

namespace bsk::platform {

enum class KeyCode {
  Unknown = 0,
  Escape,
  Space,
  F1,
  F5
};

struct WindowDesc {
  int width = 1280;
  int height = 720;
  const char* title = "blobskin";
};

struct Color {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;
  uint8_t a = 255;
};

class Platform;

namespace detail {
bool platform_init(Platform* self, const WindowDesc& desc);
void platform_shutdown(Platform* self);
void platform_poll_events(Platform* self);
float platform_delta_seconds(Platform* self);
void platform_begin_frame(Platform* self, const Color& clear);
void platform_draw_lines(Platform* self, const std::vector<Segment>& segments, const Color& color);
void platform_present(Platform* self);
} // namespace detail

// SDL window with a 2D renderer. Coordinates are window pixels.
class Platform {
 public:
  bool init(const WindowDesc& desc);
  void shutdown();
  void poll_events();
  bool should_quit() const { return quit_; }
  float delta_seconds();
  bool is_key_down(KeyCode code) const;
  // True once per key press since the last poll_events.
  bool was_key_pressed(KeyCode code) const;
  const Vec2& mouse_position() const { return mouse_; }
  int width() const { return width_; }
  int height() const { return height_; }
  void request_quit();

  void begin_frame(const Color& clear);
  void draw_lines(const std::vector<Segment>& segments, const Color& color);
  void present();

 private:
  friend bool detail::platform_init(Platform* self, const WindowDesc& desc);
  friend void detail::platform_shutdown(Platform* self);
  friend void detail::platform_poll_events(Platform* self);
  friend float detail::platform_delta_seconds(Platform* self);
  friend void detail::platform_begin_frame(Platform* self, const Color& clear);
  friend void detail::platform_draw_lines(Platform* self, const std::vector<Segment>& segments,
                                          const Color& color);
  friend void detail::platform_present(Platform* self);

  bool quit_ = false;
  unsigned long long last_ticks_ = 0;
  void* window_ = nullptr;
  void* renderer_ = nullptr;
  int width_ = 0;
  int height_ = 0;
  Vec2 mouse_{0.0f, 0.0f};
  std::unordered_set<KeyCode> keys_down_;
  std::unordered_set<KeyCode> keys_pressed_;
};

} // namespace bsk::platform
