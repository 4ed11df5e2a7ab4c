/**
 * @file asset_set.hpp
 * @brief Submission inputs and the validation gate in front of the pipeline
 *
 * @details A caller hands in a RawSubmission (whatever it received). The
 *          validator either produces an AssetSet, whose invariants every
 *          downstream component relies on, or the complete list of unmet
 *          constraints. Validation is synchronous and touches no storage.
 */

#ifndef SLIDE_REEL_ASSET_SET_HPP
#define SLIDE_REEL_ASSET_SET_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace slide_reel {

/// Number of images a submission must carry
constexpr size_t REQUIRED_IMAGE_COUNT = 30;

/// Name used when the caller supplies none
constexpr const char *DEFAULT_PROJECT_NAME = "Untitled Project";

/**
 * @struct RawSubmission
 * @brief Unvalidated candidate inputs for one run.
 * @note Image order is the caller's order and is never re-sorted.
 */
struct RawSubmission {
  std::string project_name;
  std::vector<Blob> images;
  std::optional<Blob> narration;
  std::optional<std::string> soundtrack_id;
  std::optional<std::string> filter_id;
  std::optional<Blob> thumbnail;
};

/**
 * @struct AssetSet
 * @brief Validated, ordered inputs for one run.
 *
 * @attention INVARIANTS:
 *
 * - images.size() == REQUIRED_IMAGE_COUNT, none empty
 *
 * - narration non-empty
 *
 * - optional ids, when present, are non-empty strings
 */
struct AssetSet {
  std::string project_name;
  std::vector<Blob> images;
  Blob narration;
  std::optional<std::string> soundtrack_id;
  std::optional<std::string> filter_id;
  std::optional<Blob> thumbnail;

  bool has_soundtrack() const { return soundtrack_id.has_value(); }
  bool has_filter() const { return filter_id.has_value(); }
  bool has_thumbnail() const { return thumbnail.has_value(); }
};

/**
 * @struct ValidationResult
 * @brief Either an AssetSet or every failure found.
 */
struct ValidationResult {
  std::optional<AssetSet> assets;
  std::vector<ValidationFailure> failures;

  bool ok() const { return assets.has_value(); }
};

/**
 * @brief Validate a submission, consuming its blobs.
 *
 * @note All constraints are checked; the result lists every failure, e.g.
 *       "images: expected 30, got 29" and "narration: missing or empty".
 *       Blank optional ids are treated as "not selected"; a blank project
 *       name becomes DEFAULT_PROJECT_NAME.
 */
ValidationResult validate_submission(RawSubmission submission);

/**
 * @brief File extension (without dot) guessed from a blob's magic bytes.
 * @param data Blob to inspect
 * @param fallback Returned when no known signature matches
 */
std::string sniff_extension(const Blob &data, const std::string &fallback);

} // namespace slide_reel

#endif // SLIDE_REEL_ASSET_SET_HPP
