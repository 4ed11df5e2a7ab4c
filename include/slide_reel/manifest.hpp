/**
 * @file manifest.hpp
 * @brief Project manifests for the command-line front end
 *
 * @details A manifest names the files of one submission:
 *
 *          {"name": "...", "images": ["a.jpg", ... x30], "narration": "n.mp3",
 *           "soundtrack": "<catalog id>", "filter": "<catalog id>",
 *           "thumbnail": "t.png"}
 *
 *          Relative paths are resolved against the manifest's directory.
 *          Counts are not checked here; that is the validator's job.
 */

#ifndef SLIDE_REEL_MANIFEST_HPP
#define SLIDE_REEL_MANIFEST_HPP

#include <string>

#include "asset_set.hpp"

namespace slide_reel {

/**
 * @brief Parse manifest text and read the files it references.
 * @param text Manifest JSON
 * @param base_dir Directory relative paths are resolved against
 * @param out Submission to fill
 * @param error Reason on failure
 * @return false if the JSON is malformed or a referenced file is unreadable
 */
bool parse_manifest(const std::string &text, const std::string &base_dir,
                    RawSubmission &out, std::string &error);

/// Read a manifest file and parse it relative to its own directory
bool load_manifest(const std::string &path, RawSubmission &out,
                   std::string &error);

} // namespace slide_reel

#endif // SLIDE_REEL_MANIFEST_HPP
