#include <sxb/element.hpp>
#include <sxb/serializer.hpp>

#include <utility>

namespace sxb {

  void
  element::require_empty(const char* action) const {
    if (std::holds_alternative<std::monostate>(content_)) return;
    const char* state = std::holds_alternative<std::string>(content_)
                            ? "text"
                            : "child elements";
    throw contract_violation(std::string("cannot ") + action + " element '" +
                             name_ + "': it already holds " + state);
  }

  void
  element::add_child(element child) {
    if (std::holds_alternative<std::string>(content_)) {
      throw contract_violation("cannot add child element to element '" +
                               name_ + "': it already holds text");
    }
    if (auto* list = std::get_if<child_list>(&content_)) {
      list->push_back(std::move(child));
      return;
    }
    child_list list;
    list.push_back(std::move(child));
    content_ = std::move(list);
  }

  content_kind
  element::kind() const {
    if (std::holds_alternative<child_list>(content_))
      return content_kind::children;
    if (std::holds_alternative<std::string>(content_))
      return content_kind::text;
    return content_kind::empty;
  }

  const element::child_list&
  element::children() const {
    static const child_list none;
    if (auto* list = std::get_if<child_list>(&content_)) return *list;
    return none;
  }

  std::string_view
  element::text() const {
    if (auto* s = std::get_if<std::string>(&content_)) return *s;
    return {};
  }

  void
  element::write(byte_sink& sink) const {
    write_document(*this, sink);
  }

  void
  element::write(std::ostream& os) const {
    ostream_sink sink(os);
    write_document(*this, sink);
  }

  void
  element::write(const std::filesystem::path& path) const {
    file_sink sink(path);
    write_document(*this, sink);
  }

  std::string
  element::to_string() const {
    string_sink sink;
    write_document(*this, sink);
    return sink.release();
  }

} // namespace sxb
