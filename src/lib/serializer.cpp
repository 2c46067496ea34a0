#include <sxb/element.hpp>
#include <sxb/serializer.hpp>

#include <string>

namespace sxb {

  namespace {

    // Opening tag text without the closing '>' or " />".
    void
    append_start_tag(std::string& line, const element& e) {
      line += '<';
      line += e.name();
      for (const auto& [name, value] : e.attributes()) {
        line += ' ';
        line += name;
        line += "=\"";
        line += value;
        line += '"';
      }
    }

  } // namespace

  void
  write_document(const element& root, byte_sink& sink) {
    std::string line(xml_declaration);
    line += '\n';
    sink.write(line);
    write_element(root, sink, 0);
    sink.flush();
  }

  void
  write_element(const element& e, byte_sink& sink, std::size_t level) {
    std::string line(level, '\t');
    append_start_tag(line, e);

    switch (e.kind()) {
      case content_kind::empty:
        line += " />\n";
        sink.write(line);
        break;

      case content_kind::children: {
        line += ">\n";
        sink.write(line);
        for (const auto& child : e.children()) {
          write_element(child, sink, level + 1);
        }
        std::string close(level, '\t');
        close += "</";
        close += e.name();
        close += ">\n";
        sink.write(close);
        break;
      }

      case content_kind::text:
        // Embedded newlines in the text are written as-is.
        line += '>';
        line += e.text();
        line += "</";
        line += e.name();
        line += ">\n";
        sink.write(line);
        break;
    }
  }

} // namespace sxb
