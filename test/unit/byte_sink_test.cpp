#include <sxb/byte_sink.hpp>
#include <sxb/error.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <sstream>
#include <streambuf>
#include <string>

using namespace sxb;

namespace fs = std::filesystem;

namespace {

  // Stream buffer that accepts nothing.
  class rejecting_buffer : public std::streambuf {
  protected:
    int_type
    overflow(int_type) override {
      return traits_type::eof();
    }

    std::streamsize
    xsputn(const char_type*, std::streamsize) override {
      return 0;
    }
  };

} // namespace

TEST_CASE("string_sink: appends in order", "[byte_sink]") {
  string_sink sink;
  sink.write("<a>");
  sink.write("</a>\n");
  sink.flush();
  CHECK(sink.str() == "<a></a>\n");
  CHECK(sink.release() == "<a></a>\n");
}

TEST_CASE("ostream_sink: forwards bytes", "[byte_sink]") {
  std::ostringstream os;
  ostream_sink sink(os);
  sink.write("abc");
  sink.write(std::string_view("d\0e", 3));
  sink.flush();
  CHECK(os.str() == std::string("abcd\0e", 6));
}

TEST_CASE("ostream_sink: failed stream raises io_error", "[byte_sink]") {
  std::ostringstream os;
  os.setstate(std::ios::badbit);
  ostream_sink sink(os);
  CHECK_THROWS_AS(sink.write("x"), io_error);
}

TEST_CASE("ostream_sink: stream exceptions become io_error", "[byte_sink]") {
  rejecting_buffer buf;
  std::ostream os(&buf);
  os.exceptions(std::ios::badbit | std::ios::failbit);
  ostream_sink sink(os);
  CHECK_THROWS_AS(sink.write("x"), io_error);
}

TEST_CASE("file_sink: writes and truncates", "[byte_sink]") {
  auto path = fs::temp_directory_path() / "sxb_byte_sink_test.xml";
  {
    std::ofstream old(path);
    old << "previous content that is longer";
  }
  {
    file_sink sink(path);
    sink.write("<new />\n");
    sink.flush();
  }
  std::ifstream in(path, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  CHECK(content == "<new />\n");
  fs::remove(path);
}

TEST_CASE("file_sink: unopenable path raises io_error", "[byte_sink]") {
  auto path = fs::temp_directory_path() / "sxb_missing_dir" / "nested" /
              "out.xml";
  CHECK_THROWS_AS(file_sink(path), io_error);
}
