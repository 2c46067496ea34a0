#pragma once

#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace sxb {

  // Destination for serialized bytes. Implementations throw io_error when a
  // write cannot be completed.
  class byte_sink {
  public:
    virtual ~byte_sink() = default;

    virtual void
    write(std::string_view bytes) = 0;

    virtual void
    flush() {}
  };

  class ostream_sink : public byte_sink {
  public:
    explicit ostream_sink(std::ostream& os) : os_(os) {}

    void
    write(std::string_view bytes) override;

    void
    flush() override;

  private:
    std::ostream& os_;
  };

  class string_sink : public byte_sink {
  public:
    string_sink() = default;

    void
    write(std::string_view bytes) override {
      buffer_.append(bytes);
    }

    const std::string&
    str() const {
      return buffer_;
    }

    std::string
    release() {
      return std::move(buffer_);
    }

  private:
    std::string buffer_;
  };

  // Truncates and writes the file at path (binary mode).
  class file_sink : public byte_sink {
  public:
    explicit file_sink(const std::filesystem::path& path);
    ~file_sink() override;

    file_sink(const file_sink&) = delete;
    file_sink&
    operator=(const file_sink&) = delete;
    file_sink(file_sink&&) noexcept;
    file_sink&
    operator=(file_sink&&) noexcept;

    void
    write(std::string_view bytes) override;

    void
    flush() override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace sxb
