#include "fixtures/sample_assets.hpp"

#include <atomic>
#include <filesystem>
#include <stdexcept>

#include <unistd.h>

namespace slide_reel::tests::fixtures {

namespace {

Blob bytes(std::initializer_list<uint8_t> head, size_t pad = 16) {
  Blob b(head);
  b.resize(b.size() + pad, 0x00);
  return b;
}

} // namespace

Blob png_blob() { return bytes({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}); }

Blob jpeg_blob() { return bytes({0xFF, 0xD8, 0xFF, 0xE0}); }

Blob mp3_blob() { return bytes({'I', 'D', '3', 0x04, 0x00}); }

Blob wav_blob() {
  return bytes({'R', 'I', 'F', 'F', 0x24, 0x00, 0x00, 0x00, 'W', 'A', 'V', 'E'});
}

Blob mp4_blob() {
  return bytes({0x00, 0x00, 0x00, 0x18, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm'});
}

RawSubmission make_submission(size_t image_count) {
  RawSubmission s;
  s.project_name = "Test Project";
  for (size_t i = 0; i < image_count; ++i)
    s.images.push_back(png_blob());
  s.narration = mp3_blob();
  return s;
}

AssetSet make_assets(bool with_thumbnail,
                     std::optional<std::string> soundtrack_id,
                     std::optional<std::string> filter_id) {
  RawSubmission s = make_submission();
  if (with_thumbnail)
    s.thumbnail = jpeg_blob();
  s.soundtrack_id = std::move(soundtrack_id);
  s.filter_id = std::move(filter_id);

  ValidationResult r = validate_submission(std::move(s));
  if (!r.ok())
    throw std::runtime_error("sample submission failed validation");
  return std::move(*r.assets);
}

std::string make_temp_dir(const std::string &tag) {
  namespace fs = std::filesystem;
  static std::atomic<int> counter{0};
  fs::path dir = fs::temp_directory_path() /
                 ("slide_reel_" + tag + "_" + std::to_string(getpid()) + "_" +
                  std::to_string(counter.fetch_add(1)));
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir.string();
}

} // namespace slide_reel::tests::fixtures
