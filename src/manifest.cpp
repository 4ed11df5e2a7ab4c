/**
 * @file manifest.cpp
 * @brief Manifest parsing
 */

#include "slide_reel/manifest.hpp"

#include <filesystem>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "slide_reel/file_util.hpp"

using json = nlohmann::json;

namespace slide_reel {

namespace fs = std::filesystem;

namespace {

bool read_referenced(const std::string &base_dir, const std::string &ref,
                     Blob &out, std::string &error) {
  fs::path p(ref);
  if (p.is_relative())
    p = fs::path(base_dir) / p;
  if (!read_file(p.string(), out)) {
    error = fmt::format("cannot read '{}'", p.string());
    return false;
  }
  return true;
}

} // namespace

bool parse_manifest(const std::string &text, const std::string &base_dir,
                    RawSubmission &out, std::string &error) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    error = "manifest is not a JSON object";
    return false;
  }

  out = RawSubmission{};
  auto name = doc.find("name");
  if (name != doc.end() && name->is_string())
    out.project_name = name->get<std::string>();

  auto images = doc.find("images");
  if (images != doc.end()) {
    if (!images->is_array()) {
      error = "'images' must be an array of paths";
      return false;
    }
    out.images.reserve(images->size());
    for (const auto &item : *images) {
      if (!item.is_string()) {
        error = "'images' must be an array of paths";
        return false;
      }
      Blob data;
      if (!read_referenced(base_dir, item.get<std::string>(), data, error))
        return false;
      out.images.push_back(std::move(data));
    }
  }

  auto narration = doc.find("narration");
  if (narration != doc.end() && narration->is_string()) {
    Blob data;
    if (!read_referenced(base_dir, narration->get<std::string>(), data, error))
      return false;
    out.narration = std::move(data);
  }

  auto thumbnail = doc.find("thumbnail");
  if (thumbnail != doc.end() && thumbnail->is_string()) {
    Blob data;
    if (!read_referenced(base_dir, thumbnail->get<std::string>(), data, error))
      return false;
    out.thumbnail = std::move(data);
  }

  auto soundtrack = doc.find("soundtrack");
  if (soundtrack != doc.end() && soundtrack->is_string())
    out.soundtrack_id = soundtrack->get<std::string>();

  auto filter = doc.find("filter");
  if (filter != doc.end() && filter->is_string())
    out.filter_id = filter->get<std::string>();

  return true;
}

bool load_manifest(const std::string &path, RawSubmission &out,
                   std::string &error) {
  std::string text;
  if (!read_text(path, text)) {
    error = fmt::format("cannot read manifest '{}'", path);
    return false;
  }
  std::string base = fs::path(path).parent_path().string();
  return parse_manifest(text, base.empty() ? "." : base, out, error);
}

} // namespace slide_reel
