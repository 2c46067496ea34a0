#include <sxb/byte_sink.hpp>
#include <sxb/error.hpp>

#include <fstream>
#include <ios>

namespace sxb {

  void
  ostream_sink::write(std::string_view bytes) {
    try {
      os_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    } catch (const std::ios_base::failure& e) {
      throw io_error(std::string("stream write failed: ") + e.what());
    }
    if (!os_) throw io_error("stream write failed");
  }

  void
  ostream_sink::flush() {
    try {
      os_.flush();
    } catch (const std::ios_base::failure& e) {
      throw io_error(std::string("stream flush failed: ") + e.what());
    }
    if (!os_) throw io_error("stream flush failed");
  }

  struct file_sink::impl {
    std::filesystem::path path;
    std::ofstream out;

    explicit impl(const std::filesystem::path& p)
        : path(p), out(p, std::ios::binary | std::ios::trunc) {}

    void
    check(const char* what) const {
      if (!out) {
        throw io_error(std::string("cannot ") + what + " file: " +
                       path.string());
      }
    }
  };

  file_sink::file_sink(const std::filesystem::path& path)
      : impl_(std::make_unique<impl>(path)) {
    impl_->check("open");
  }

  file_sink::~file_sink() = default;
  file_sink::file_sink(file_sink&&) noexcept = default;
  file_sink&
  file_sink::operator=(file_sink&&) noexcept = default;

  void
  file_sink::write(std::string_view bytes) {
    impl_->out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    impl_->check("write");
  }

  void
  file_sink::flush() {
    impl_->out.flush();
    impl_->check("flush");
  }

} // namespace sxb
