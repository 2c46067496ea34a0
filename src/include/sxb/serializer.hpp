#pragma once

#include <sxb/byte_sink.hpp>

#include <cstddef>
#include <string_view>

namespace sxb {

  class element;

  inline constexpr std::string_view xml_declaration =
      R"(<?xml version = "1.0" encoding = "UTF-8"?>)";

  // Declaration line followed by root at level 0, then flush.
  void
  write_document(const element& root, byte_sink& sink);

  // One subtree, each line prefixed by one tab per level. Every line ends in
  // '\n' and is handed to the sink in a single write.
  void
  write_element(const element& e, byte_sink& sink, std::size_t level);

} // namespace sxb
