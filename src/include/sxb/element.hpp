#pragma once

#include <sxb/attribute_map.hpp>
#include <sxb/byte_sink.hpp>
#include <sxb/error.hpp>
#include <sxb/text.hpp>
#include <sxb/xml_escape.hpp>

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace sxb {

  enum class content_kind { empty, children, text };

  // One XML element: a tag name, ordered attributes, and either nothing,
  // child elements or text. Attribute values and text are escaped when they
  // are added and stored in escaped form.
  class element {
  public:
    using child_list = std::vector<element>;

    // The name may be any value with a textual representation.
    template <typename N,
              typename = std::enable_if_t<
                  !std::is_same_v<std::decay_t<N>, element>>>
    explicit element(const N& name) : name_(to_text(name)) {}

    // Adds or replaces an attribute. A replaced attribute keeps its
    // position.
    template <typename N, typename T>
    void
    add_attribute(const N& name, const T& value) {
      attributes_.insert_or_assign(to_text(name), escape(to_text(value)));
    }

    // Appends a child element after any previously added children.
    // Throws contract_violation if this element holds text.
    void
    add_child(element child);

    // Sets the text content. Only an empty element may receive text; any
    // other state throws contract_violation.
    template <typename T>
    void
    add_text(const T& text) {
      require_empty("add text to");
      content_ = escape(to_text(text));
    }

    // Writes a UTF-8 XML document with this element as the root.
    // Sink failures propagate as io_error; output may be truncated.
    void
    write(byte_sink& sink) const;
    void
    write(std::ostream& os) const;
    void
    write(const std::filesystem::path& path) const;

    // The document write() would produce.
    std::string
    to_string() const;

    const std::string&
    name() const {
      return name_;
    }

    const attribute_map&
    attributes() const {
      return attributes_;
    }

    content_kind
    kind() const;

    // Empty unless kind() is content_kind::children.
    const child_list&
    children() const;

    // Escaped text; empty unless kind() is content_kind::text.
    std::string_view
    text() const;

    bool
    operator==(const element&) const;

    friend std::ostream&
    operator<<(std::ostream& os, const element& e) {
      return os << e.to_string();
    }

  private:
    void
    require_empty(const char* action) const;

    std::string name_;
    attribute_map attributes_;
    std::variant<std::monostate, child_list, std::string> content_;
  };

  // Defined out-of-line: element must be complete before comparing the
  // variant that holds std::vector<element>.
  inline bool
  element::operator==(const element& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_ &&
           content_ == other.content_;
  }

} // namespace sxb
