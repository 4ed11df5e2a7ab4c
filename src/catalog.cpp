/**
 * @file catalog.cpp
 * @brief JSON-backed soundtrack and filter catalogs
 */

#include "slide_reel/catalog.hpp"

#include <filesystem>
#include <utility>

#include <nlohmann/json.hpp>

#include "slide_reel/file_util.hpp"
#include "slide_reel/logging.hpp"

using json = nlohmann::json;

namespace slide_reel {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> optional_string(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

/// id, name and file are mandatory strings in both catalogs
bool has_required_fields(const json &obj) {
  return obj.is_object() && optional_string(obj, "id") &&
         optional_string(obj, "name") && optional_string(obj, "file");
}

} // namespace

JsonCatalog::JsonCatalog(std::string asset_root)
    : asset_root_(std::move(asset_root)) {}

bool JsonCatalog::load_files(const std::string &soundtracks_path,
                             const std::string &filters_path) {
  std::string text;
  if (read_text(soundtracks_path, text)) {
    if (!parse_soundtracks(text)) {
      LOG_ERROR("Soundtrack catalog is not a JSON array: {}", soundtracks_path);
      return false;
    }
  } else {
    LOG_WARN("Soundtrack catalog not found: {}", soundtracks_path);
  }

  if (read_text(filters_path, text)) {
    if (!parse_filters(text)) {
      LOG_ERROR("Filter catalog is not a JSON array: {}", filters_path);
      return false;
    }
  } else {
    LOG_WARN("Filter catalog not found: {}", filters_path);
  }

  LOG_INFO("Catalogs loaded: {} soundtracks, {} filters", soundtracks_.size(),
           filters_.size());
  return true;
}

bool JsonCatalog::parse_soundtracks(const std::string &json_text) {
  json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded() || !root.is_array())
    return false;

  for (const auto &item : root) {
    if (!has_required_fields(item)) {
      LOG_WARN("Skipping soundtrack entry without id/name/file");
      continue;
    }
    SoundtrackEntry entry;
    entry.id = item["id"].get<std::string>();
    entry.name = item["name"].get<std::string>();
    entry.file_ref = item["file"].get<std::string>();
    auto duration = item.find("duration");
    if (duration != item.end() && duration->is_number() &&
        duration->get<double>() > 0) {
      entry.duration_seconds = duration->get<double>();
    }
    entry.genre = optional_string(item, "genre");

    if (!soundtracks_.emplace(entry.id, entry).second) {
      LOG_WARN("Skipping duplicate soundtrack id '{}'", entry.id);
    }
  }
  return true;
}

bool JsonCatalog::parse_filters(const std::string &json_text) {
  json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded() || !root.is_array())
    return false;

  for (const auto &item : root) {
    if (!has_required_fields(item)) {
      LOG_WARN("Skipping filter entry without id/name/file");
      continue;
    }
    FilterEntry entry;
    entry.id = item["id"].get<std::string>();
    entry.name = item["name"].get<std::string>();
    entry.file_ref = item["file"].get<std::string>();
    entry.preview_ref = optional_string(item, "preview");
    entry.description = optional_string(item, "description");

    if (!filters_.emplace(entry.id, entry).second) {
      LOG_WARN("Skipping duplicate filter id '{}'", entry.id);
    }
  }
  return true;
}

std::optional<SoundtrackEntry>
JsonCatalog::find_soundtrack(const std::string &id) const {
  auto it = soundtracks_.find(id);
  if (it == soundtracks_.end())
    return std::nullopt;
  return it->second;
}

std::optional<FilterEntry> JsonCatalog::find_filter(const std::string &id) const {
  auto it = filters_.find(id);
  if (it == filters_.end())
    return std::nullopt;
  return it->second;
}

bool JsonCatalog::fetch(const std::string &file_ref, Blob &out) const {
  /// Web-style refs ("/sounds/rain.mp3") are relative to the asset root
  std::string relative = file_ref;
  while (!relative.empty() && relative.front() == '/')
    relative.erase(relative.begin());

  fs::path ref(relative);
  bool escapes = relative.empty();
  for (const auto &part : ref) {
    if (part == "..")
      escapes = true;
  }
  if (escapes) {
    LOG_WARN("Rejecting catalog reference '{}'", file_ref);
    return false;
  }
  return read_file((fs::path(asset_root_) / ref).string(), out);
}

} // namespace slide_reel
