/**
 * @file asset_set.cpp
 * @brief Submission validation and content sniffing
 */

#include "slide_reel/asset_set.hpp"

#include <cstring>
#include <utility>

#include <fmt/core.h>

namespace slide_reel {

namespace {

bool has_prefix(const Blob &data, size_t offset, const char *magic) {
  size_t len = std::strlen(magic);
  if (data.size() < offset + len)
    return false;
  return std::memcmp(data.data() + offset, magic, len) == 0;
}

/// Treat "" and all-whitespace ids as not selected
std::optional<std::string> normalize_id(std::optional<std::string> id) {
  if (!id)
    return std::nullopt;
  if (id->find_first_not_of(" \t\r\n") == std::string::npos)
    return std::nullopt;
  return id;
}

} // namespace

ValidationResult validate_submission(RawSubmission submission) {
  ValidationResult result;

  if (submission.images.size() != REQUIRED_IMAGE_COUNT) {
    result.failures.push_back(
        {"images", fmt::format("expected {}, got {}", REQUIRED_IMAGE_COUNT,
                               submission.images.size())});
  }
  for (size_t i = 0; i < submission.images.size(); ++i) {
    if (submission.images[i].empty()) {
      result.failures.push_back({fmt::format("images[{}]", i), "empty blob"});
    }
  }

  if (!submission.narration || submission.narration->empty()) {
    result.failures.push_back({"narration", "missing or empty"});
  }

  if (submission.thumbnail && submission.thumbnail->empty()) {
    result.failures.push_back({"thumbnail", "empty blob"});
  }

  if (!result.failures.empty())
    return result;

  AssetSet assets;
  assets.project_name = submission.project_name.empty()
                            ? std::string(DEFAULT_PROJECT_NAME)
                            : std::move(submission.project_name);
  assets.images = std::move(submission.images);
  assets.narration = std::move(*submission.narration);
  assets.soundtrack_id = normalize_id(std::move(submission.soundtrack_id));
  assets.filter_id = normalize_id(std::move(submission.filter_id));
  assets.thumbnail = std::move(submission.thumbnail);
  result.assets = std::move(assets);
  return result;
}

std::string sniff_extension(const Blob &data, const std::string &fallback) {
  // Images
  if (has_prefix(data, 0, "\x89PNG"))
    return "png";
  if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF)
    return "jpg";
  if (has_prefix(data, 0, "GIF8"))
    return "gif";
  if (has_prefix(data, 0, "RIFF") && has_prefix(data, 8, "WEBP"))
    return "webp";
  if (has_prefix(data, 0, "BM"))
    return "bmp";

  // Audio
  if (has_prefix(data, 0, "RIFF") && has_prefix(data, 8, "WAVE"))
    return "wav";
  if (has_prefix(data, 0, "ID3"))
    return "mp3";
  if (data.size() >= 2 && data[0] == 0xFF && (data[1] & 0xE0) == 0xE0)
    return "mp3";
  if (has_prefix(data, 0, "OggS"))
    return "ogg";
  if (has_prefix(data, 0, "fLaC"))
    return "flac";

  // ISO base media: brand decides audio-only vs clip
  if (has_prefix(data, 4, "ftyp")) {
    if (has_prefix(data, 8, "M4A "))
      return "m4a";
    if (has_prefix(data, 8, "qt  "))
      return "mov";
    return "mp4";
  }
  if (data.size() >= 4 && data[0] == 0x1A && data[1] == 0x45 &&
      data[2] == 0xDF && data[3] == 0xA3)
    return "webm";

  return fallback;
}

} // namespace slide_reel
