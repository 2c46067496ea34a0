#include <sxb/text.hpp>

#include <charconv>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <system_error>

namespace sxb {

  namespace {

    constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

    struct sequence {
      std::size_t length;
      bool valid;
    };

    // Classify the UTF-8 sequence starting at pos. An invalid sequence
    // reports the length of its maximal well-formed prefix (at least 1), so
    // each one maps to a single replacement character.
    sequence
    scan_sequence(std::string_view text, std::size_t pos) {
      auto byte = [&](std::size_t i) {
        return static_cast<unsigned char>(text[i]);
      };

      unsigned char lead = byte(pos);
      if (lead < 0x80) return {1, true};

      std::size_t needed = 0;
      unsigned char lo = 0x80;
      unsigned char hi = 0xBF;
      if (lead >= 0xC2 && lead <= 0xDF) {
        needed = 1;
      } else if (lead == 0xE0) {
        needed = 2;
        lo = 0xA0;
      } else if (lead >= 0xE1 && lead <= 0xEC) {
        needed = 2;
      } else if (lead == 0xED) {
        needed = 2;
        hi = 0x9F;
      } else if (lead >= 0xEE && lead <= 0xEF) {
        needed = 2;
      } else if (lead == 0xF0) {
        needed = 3;
        lo = 0x90;
      } else if (lead >= 0xF1 && lead <= 0xF3) {
        needed = 3;
      } else if (lead == 0xF4) {
        needed = 3;
        hi = 0x8F;
      } else {
        return {1, false};
      }

      std::size_t i = pos + 1;
      for (std::size_t n = 0; n < needed; ++n, ++i) {
        if (i >= text.size()) return {i - pos, false};
        unsigned char b = byte(i);
        // Only the first continuation byte has a restricted range.
        if (n == 0 ? (b < lo || b > hi) : (b < 0x80 || b > 0xBF)) {
          return {i - pos, false};
        }
      }
      return {needed + 1, true};
    }

    template <typename T>
    std::string
    format_floating(T value) {
      if (std::isinf(value)) return value > 0 ? "INF" : "-INF";
      if (std::isnan(value)) return "NaN";

      char buf[128];
      auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
      if (ec != std::errc{})
        throw std::runtime_error("failed to format floating-point value");
      return std::string(buf, ptr);
    }

  } // namespace

  bool
  is_valid_utf8(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
      auto seq = scan_sequence(text, pos);
      if (!seq.valid) return false;
      pos += seq.length;
    }
    return true;
  }

  std::string
  make_valid_utf8(std::string_view text) {
    if (is_valid_utf8(text)) return std::string(text);

    std::string result;
    result.reserve(text.size() + replacement_character.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
      auto seq = scan_sequence(text, pos);
      if (seq.valid) {
        result.append(text.substr(pos, seq.length));
      } else {
        result.append(replacement_character);
      }
      pos += seq.length;
    }
    return result;
  }

  std::string
  format_float(float value) {
    return format_floating(value);
  }

  std::string
  format_float(double value) {
    return format_floating(value);
  }

  std::string
  format_float(long double value) {
    return format_floating(value);
  }

} // namespace sxb
