#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace stevedore::core {

// Streaming JSON writer for tool reports (stevedore_sandbox --json).
// Escapes strings; pretty-prints with a fixed indent unless compact.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true) : out_(out), pretty_(pretty) {}

  void beginObject() { open('{'); }
  void endObject() { close('}'); }
  void beginArray() { open('['); }
  void endArray() { close(']'); }

  void key(std::string_view k) {
    separate();
    writeString(k);
    out_ << (pretty_ ? ": " : ":");
    pendingKey_ = true;
  }

  void value(std::string_view s) { separate(); writeString(s); }
  void value(const char* s) { value(std::string_view(s ? s : "")); }
  void value(const std::string& s) { value(std::string_view(s)); }
  void value(double v) { separate(); out_ << v; }
  void value(long long v) { separate(); out_ << v; }
  void value(unsigned long long v) { separate(); out_ << v; }
  void value(int v) { value(static_cast<long long>(v)); }
  void value(bool v) { separate(); out_ << (v ? "true" : "false"); }
  void nullValue() { separate(); out_ << "null"; }

  template <typename T>
  void field(std::string_view k, const T& v) {
    key(k);
    value(v);
  }

private:
  struct Frame {
    char closer;
    std::size_t count;
  };

  // Comma + newline + indent before any element that is not a key's value.
  void separate() {
    if (pendingKey_) {
      pendingKey_ = false;
      return;
    }
    if (frames_.empty()) return;
    auto& f = frames_.back();
    if (f.count++ > 0) out_ << ',';
    newline(frames_.size());
  }

  void open(char c) {
    separate();
    out_ << c;
    frames_.push_back(Frame{c == '{' ? '}' : ']', 0});
  }

  void close(char c) {
    if (frames_.empty() || frames_.back().closer != c) return;
    const bool empty = frames_.back().count == 0;
    frames_.pop_back();
    if (!empty) newline(frames_.size());
    out_ << c;
  }

  void newline(std::size_t depth) {
    if (!pretty_) return;
    out_ << '\n' << std::string(depth * 2, ' ');
  }

  void writeString(std::string_view s) {
    static const char* kHex = "0123456789abcdef";
    out_ << '"';
    for (const char c : s) {
      switch (c) {
        case '"':  out_ << "\\\""; break;
        case '\\': out_ << "\\\\"; break;
        case '\n': out_ << "\\n"; break;
        case '\r': out_ << "\\r"; break;
        case '\t': out_ << "\\t"; break;
        default:
          if ((unsigned char)c < 0x20) {
            out_ << "\\u00" << kHex[((unsigned char)c >> 4) & 0xF] << kHex[(unsigned char)c & 0xF];
          } else {
            out_ << c;
          }
      }
    }
    out_ << '"';
  }

  std::ostream& out_;
  bool pretty_{true};
  bool pendingKey_{false};
  std::vector<Frame> frames_;
};

} // namespace stevedore::core
