#include "bsk/json_write.h"

#include <charconv>
#include <cmath>

namespace bsk::json {

void Writer::separate() {
  if (scopes_.empty()) return;
  Scope& top = scopes_.back();
  if (top.after_key) {
    top.after_key = false;
    return;
  }
  if (!top.empty) out_.put(',');
  top.empty = false;
}

void Writer::open(bool object, char bracket) {
  separate();
  out_.put(bracket);
  scopes_.push_back(Scope{object, true, false});
}

void Writer::close(char bracket) {
  out_.put(bracket);
  if (!scopes_.empty()) scopes_.pop_back();
}

void Writer::begin_object() {
  open(true, '{');
}

void Writer::end_object() {
  close('}');
}

void Writer::begin_array() {
  open(false, '[');
}

void Writer::end_array() {
  close(']');
}

void Writer::key(std::string_view name) {
  if (scopes_.empty() || !scopes_.back().object) return;
  separate();
  quoted(name);
  out_.put(':');
  scopes_.back().after_key = true;
}

void Writer::quoted(std::string_view text) {
  static const char kHex[] = "0123456789abcdef";
  out_.put('"');
  for (char ch : text) {
    const auto c = static_cast<unsigned char>(ch);
    if (c == '"' || c == '\\') {
      out_.put('\\');
      out_.put(ch);
    } else if (c == '\n') {
      out_ << "\\n";
    } else if (c == '\t') {
      out_ << "\\t";
    } else if (c < 0x20) {
      out_ << "\\u00" << kHex[c >> 4] << kHex[c & 0xF];
    } else {
      out_.put(ch);
    }
  }
  out_.put('"');
}

template <typename F>
void Writer::number(F v) {
  separate();
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }
  char buffer[64];
  const auto result = std::to_chars(buffer, buffer + sizeof(buffer), v);
  out_.write(buffer, result.ptr - buffer);
}

void Writer::value(std::string_view text) {
  separate();
  quoted(text);
}

void Writer::value(float number) {
  this->number(number);
}

void Writer::value(double number) {
  this->number(number);
}

void Writer::value(int64_t number) {
  separate();
  out_ << number;
}

void Writer::value(uint64_t number) {
  separate();
  out_ << number;
}

void Writer::value(bool boolean) {
  separate();
  out_ << (boolean ? "true" : "false");
}

void Writer::null() {
  separate();
  out_ << "null";
}

void Writer::point(const Vec2& p) {
  begin_array();
  value(p.x);
  value(p.y);
  end_array();
}

void Writer::finish() {
  out_.put('\n');
}

} // namespace bsk::json
