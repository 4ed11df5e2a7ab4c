/**
 * @file catalog.hpp
 * @brief Read-only soundtrack and filter catalogs
 *
 * @details The pipeline never owns catalog state. It receives an
 *          AssetCatalog and resolves the selected ids during preparing.
 *          JsonCatalog is the file-backed implementation: two JSON arrays
 *          plus an asset root that the entries' "file" references are
 *          relative to.
 */

#ifndef SLIDE_REEL_CATALOG_HPP
#define SLIDE_REEL_CATALOG_HPP

#include <map>
#include <optional>
#include <string>

#include "types.hpp"

namespace slide_reel {

/**
 * @struct SoundtrackEntry
 * @brief One background track.
 */
struct SoundtrackEntry {
  std::string id;
  std::string name;
  std::string file_ref;
  std::optional<double> duration_seconds;
  std::optional<std::string> genre;
};

/**
 * @struct FilterEntry
 * @brief One visual overlay (green-screen clip or image).
 */
struct FilterEntry {
  std::string id;
  std::string name;
  std::string file_ref;
  std::optional<std::string> preview_ref;
  std::optional<std::string> description;
};

/**
 * @class AssetCatalog
 * @brief Lookup-by-id capability over the two catalogs.
 * @note Implementations must be safe for concurrent const use; every run
 *       worker shares one instance.
 */
class AssetCatalog {
public:
  virtual ~AssetCatalog() = default;

  virtual std::optional<SoundtrackEntry>
  find_soundtrack(const std::string &id) const = 0;

  virtual std::optional<FilterEntry>
  find_filter(const std::string &id) const = 0;

  /**
   * @brief Read the bytes behind a file reference.
   * @return false if the reference cannot be read
   */
  virtual bool fetch(const std::string &file_ref, Blob &out) const = 0;
};

/**
 * @class JsonCatalog
 * @brief AssetCatalog loaded from JSON arrays.
 *
 * @attention FORMAT:
 *
 *   soundtracks: [{"id", "name", "file", "duration"?, "genre"?}, ...]
 *
 *   filters:     [{"id", "name", "file", "preview"?, "description"?}, ...]
 *
 * @note Entries missing id/name/file, or repeating an id, are skipped with
 *       a warning. fetch() resolves references against the asset root (a
 *       leading "/" means the root itself) and refuses any that escape it.
 */
class JsonCatalog : public AssetCatalog {
public:
  explicit JsonCatalog(std::string asset_root);

  /**
   * @brief Load both catalogs from files.
   * @note A missing file yields an empty catalog and a warning; a file that
   *       is not a JSON array fails the load.
   * @return true on success
   */
  bool load_files(const std::string &soundtracks_path,
                  const std::string &filters_path);

  /// Parse a soundtrack list from JSON text; returns false if not an array
  bool parse_soundtracks(const std::string &json_text);

  /// Parse a filter list from JSON text; returns false if not an array
  bool parse_filters(const std::string &json_text);

  std::optional<SoundtrackEntry>
  find_soundtrack(const std::string &id) const override;
  std::optional<FilterEntry> find_filter(const std::string &id) const override;
  bool fetch(const std::string &file_ref, Blob &out) const override;

  size_t soundtrack_count() const { return soundtracks_.size(); }
  size_t filter_count() const { return filters_.size(); }

private:
  std::string asset_root_;
  std::map<std::string, SoundtrackEntry> soundtracks_;
  std::map<std::string, FilterEntry> filters_;
};

} // namespace slide_reel

#endif // SLIDE_REEL_CATALOG_HPP
