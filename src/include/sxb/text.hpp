#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace sxb {

  // True if text is well-formed UTF-8 (no overlongs, no surrogates, nothing
  // above U+10FFFF).
  bool
  is_valid_utf8(std::string_view text);

  // Replace each ill-formed UTF-8 sequence with U+FFFD.
  std::string
  make_valid_utf8(std::string_view text);

  std::string
  format_float(float value);
  std::string
  format_float(double value);
  std::string
  format_float(long double value);

  // Textual representation of a value, as stored in an element.
  template <typename T>
  std::string
  to_text(const T& value) {
    if constexpr (std::is_convertible_v<const T&, std::string_view>) {
      // A null C string has no characters.
      if constexpr (std::is_pointer_v<T>) {
        if (value == nullptr) return std::string();
      }
      return make_valid_utf8(std::string_view(value));
    } else if constexpr (std::is_same_v<T, bool>) {
      return value ? "true" : "false";
    } else if constexpr (std::is_same_v<T, char>) {
      return make_valid_utf8(std::string_view(&value, 1));
    } else if constexpr (std::is_integral_v<T>) {
      return std::to_string(value);
    } else if constexpr (std::is_floating_point_v<T>) {
      return format_float(value);
    } else {
      std::ostringstream os;
      os << value;
      return make_valid_utf8(os.str());
    }
  }

} // namespace sxb
