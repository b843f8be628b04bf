#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace gssa {

// Regular-file writer. Open() creates the file or truncates an existing one.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out, int mode = 0644);

    const std::string& Path() const { return path_; }

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

  private:
    std::string path_;
    Fd fd_;
};

} // namespace gssa
