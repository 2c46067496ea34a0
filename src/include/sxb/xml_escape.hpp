#pragma once

#include <string>
#include <string_view>

namespace sxb {

  // Single pass, so entity text produced for one character is never
  // re-escaped.
  inline std::string
  escape(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
      switch (c) {
        case '&':
          result += "&amp;";
          break;
        case '"':
          result += "&quot;";
          break;
        case '\'':
          result += "&apos;";
          break;
        case '<':
          result += "&lt;";
          break;
        case '>':
          result += "&gt;";
          break;
        default:
          result += c;
          break;
      }
    }
    return result;
  }

} // namespace sxb
