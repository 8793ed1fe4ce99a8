#pragma once

#include "bsk/math.h"

#include <cstdint>
#include <ostream>
#include <string_view>
#include <vector>

namespace bsk::json {

// Compact streaming writer for frame and contour dumps. Floats use their
// shortest round-trip form so dumps stay diffable between runs; non-finite
// numbers become null.
class Writer {
 public:
  explicit Writer(std::ostream& out) : out_(out) {}

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();
  void key(std::string_view name);

  void value(std::string_view text);
  void value(const char* text) { value(std::string_view(text)); }
  void value(float number);
  void value(double number);
  void value(int64_t number);
  void value(uint64_t number);
  void value(bool boolean);
  void null();
  // [x, y]
  void point(const Vec2& p);

  template <typename T>
  void field(std::string_view name, const T& v) {
    key(name);
    value(v);
  }
  void field(std::string_view name, const Vec2& p) {
    key(name);
    point(p);
  }

  // Terminates the document with a newline.
  void finish();
  int depth() const { return static_cast<int>(scopes_.size()); }

 private:
  struct Scope {
    bool object = false;
    bool empty = true;
    bool after_key = false;
  };

  void separate();
  void open(bool object, char bracket);
  void close(char bracket);
  void quoted(std::string_view text);
  template <typename F>
  void number(F v);

  std::ostream& out_;
  std::vector<Scope> scopes_;
};

} // namespace bsk::json
