#include "bsk_platform/platform.h"

namespace bsk::platform {

bool Platform::init(const WindowDesc& desc) {
  return detail::platform_init(this, desc);
}

void Platform::shutdown() {
  detail::platform_shutdown(this);
}

void Platform::poll_events() {
  keys_pressed_.clear();
  detail::platform_poll_events(this);
}

float Platform::delta_seconds() {
  return detail::platform_delta_seconds(this);
}

bool Platform::is_key_down(KeyCode code) const {
  return keys_down_.find(code) != keys_down_.end();
}

bool Platform::was_key_pressed(KeyCode code) const {
  return keys_pressed_.find(code) != keys_pressed_.end();
}

void Platform::request_quit() {
  quit_ = true;
}

void Platform::begin_frame(const Color& clear) {
  detail::platform_begin_frame(this, clear);
}

void Platform::draw_lines(const std::vector<Segment>& segments, const Color& color) {
  detail::platform_draw_lines(this, segments, color);
}

void Platform::present() {
  detail::platform_present(this);
}

} // namespace bsk::platform
