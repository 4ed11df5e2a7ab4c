/**
 * @file file_util.hpp
 * @brief Whole-file reads and atomic whole-file writes
 */

#ifndef SLIDE_REEL_FILE_UTIL_HPP
#define SLIDE_REEL_FILE_UTIL_HPP

#include <string>

#include "types.hpp"

namespace slide_reel {

/**
 * @brief Read a whole file into a blob.
 * @return false if the file cannot be opened or read
 */
bool read_file(const std::string &path, Blob &out);

/// Read a whole text file
bool read_text(const std::string &path, std::string &out);

/**
 * @brief Replace a file's contents atomically.
 * @note Writes "<path>.tmp" next to the target, then renames it over the
 *       target, so readers see either the old or the new contents. Parent
 *       directories are created as needed.
 * @return false on any I/O error (the target is left untouched)
 */
bool write_file_atomic(const std::string &path, const void *data, size_t size);

inline bool write_file_atomic(const std::string &path, const Blob &data) {
  return write_file_atomic(path, data.data(), data.size());
}

inline bool write_file_atomic(const std::string &path,
                              const std::string &text) {
  return write_file_atomic(path, text.data(), text.size());
}

} // namespace slide_reel

#endif // SLIDE_REEL_FILE_UTIL_HPP
