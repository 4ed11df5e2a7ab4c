/**
 * @file file_util.cpp
 * @brief File helpers
 */

#include "slide_reel/file_util.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "slide_reel/logging.hpp"

namespace slide_reel {

namespace fs = std::filesystem;

bool read_file(const std::string &path, Blob &out) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    return false;
  out.assign(std::istreambuf_iterator<char>(f),
             std::istreambuf_iterator<char>());
  return !f.bad();
}

bool read_text(const std::string &path, std::string &out) {
  std::ifstream f(path);
  if (!f)
    return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return !f.bad();
}

bool write_file_atomic(const std::string &path, const void *data,
                       size_t size) {
  std::error_code ec;
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Cannot create {}: {}", target.parent_path().string(),
                ec.message());
      return false;
    }
  }

  std::string temp = path + ".tmp";
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      LOG_ERROR("Cannot open {} for writing", temp);
      return false;
    }
    out.write(static_cast<const char *>(data),
              static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
      LOG_ERROR("Short write to {}", temp);
      fs::remove(temp, ec);
      return false;
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    LOG_ERROR("Cannot replace {}: {}", path, ec.message());
    std::error_code ignored;
    fs::remove(temp, ignored);
    return false;
  }
  return true;
}

} // namespace slide_reel
