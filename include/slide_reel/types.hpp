/**
 * @file types.hpp
 * @brief Core data types and product constants for Slide Reel
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Fixed output profile (frame size, frame rate, codecs)
 *
 *          - Blob alias for in-memory media payloads
 *
 *          - TimeWindow for time ranges on the final timeline
 *
 *          - Run phases and the error taxonomy
 */

#ifndef SLIDE_REEL_TYPES_HPP
#define SLIDE_REEL_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slide_reel {

// **----- OUTPUT PROFILE -----**

constexpr int OUTPUT_WIDTH = 1920;
constexpr int OUTPUT_HEIGHT = 1080;
constexpr int OUTPUT_FPS = 30;

/// Audio is normalized to this layout before mixing
constexpr int AUDIO_SAMPLE_RATE = 44100;
constexpr int AUDIO_CHANNELS = 2;

/// One AAC frame at AUDIO_SAMPLE_RATE, used as container rounding slack
constexpr double AAC_FRAME_SECONDS = 1024.0 / AUDIO_SAMPLE_RATE;

/**
 * @brief Size of the I/O buffer handed to libavformat when probing blobs.
 * @note 64KB is plenty for header probing; the artifact is already in RAM.
 */
constexpr size_t AVIO_BUFFER_SIZE = 64 * 1024;

// **----- DATA STRUCTURES -----**

/// Raw media payload (image, audio, clip) held in memory
using Blob = std::vector<uint8_t>;

/**
 * @struct TimeWindow
 * @brief A time range [start, end] in seconds on the final timeline.
 */
struct TimeWindow {
  double start; //< Start time in seconds
  double end;   //< End time in seconds

  double duration() const { return end - start; }

  bool operator==(const TimeWindow &o) const {
    return start == o.start && end == o.end;
  }
  bool operator!=(const TimeWindow &o) const { return !(*this == o); }
};

/**
 * @enum Phase
 * @brief Lifecycle phase of a pipeline run.
 * @note Transient phases are visited at most once, in declaration order.
 *       kCompleted and kError are terminal.
 */
enum class Phase {
  kLoading,
  kPreparing,
  kProcessing,
  kFinalizing,
  kCompleted,
  kError,
};

/// Lower-case wire name ("loading", "processing", ...)
const char *phase_name(Phase phase);

/// Parse a wire name; returns std::nullopt for unknown names
std::optional<Phase> phase_from_name(const std::string &name);

inline bool is_terminal(Phase phase) {
  return phase == Phase::kCompleted || phase == Phase::kError;
}

// **----- ERRORS -----**

/**
 * @enum ErrorKind
 * @brief Failure taxonomy for runs that entered the state machine.
 * @note Validation failures never reach a run; see ValidationFailure.
 */
enum class ErrorKind {
  kEngineUnavailable,
  kAssetWriteFailed,
  kEncodeStepFailed,
  kCancelled,
  kTimedOut,
};

const char *error_kind_name(ErrorKind kind);
std::optional<ErrorKind> error_kind_from_name(const std::string &name);

/**
 * @struct ErrorDetail
 * @brief Structured failure of a run.
 * @note `subject` is the step name for kEncodeStepFailed and the blob name
 *       for kAssetWriteFailed; empty otherwise.
 */
struct ErrorDetail {
  ErrorKind kind;
  std::string subject;
  std::string cause;

  bool operator==(const ErrorDetail &o) const {
    return kind == o.kind && subject == o.subject && cause == o.cause;
  }
};

/**
 * @brief Human-readable reason for status queries.
 * @return e.g. "encode step 'fade_visual' failed: exit code 1"
 */
std::string describe(const ErrorDetail &error);

/**
 * @struct ValidationFailure
 * @brief One unmet submission constraint.
 */
struct ValidationFailure {
  std::string field;      //< Offending field ("images", "narration", ...)
  std::string constraint; //< Unmet constraint ("expected 30, got 29")

  std::string to_string() const { return field + ": " + constraint; }

  bool operator==(const ValidationFailure &o) const {
    return field == o.field && constraint == o.constraint;
  }
};

} // namespace slide_reel

#endif // SLIDE_REEL_TYPES_HPP
