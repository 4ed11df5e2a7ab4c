/**
 * @file media_probe.hpp
 * @brief In-memory media probing through libavformat
 *
 * @details Provides:
 *          - MemReaderState: State for custom FFmpeg I/O from a memory buffer
 *
 *          - MemoryReader: FFmpeg I/O callbacks over that state
 *
 *          - MediaProbe: opens a blob without touching the disk and reports
 *            its stream layout
 *
 *          - verify_artifact: checks a probed artifact against the output
 *            profile and the expected duration
 */

#ifndef SLIDE_REEL_MEDIA_PROBE_HPP
#define SLIDE_REEL_MEDIA_PROBE_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include <cstdint>
#include <optional>
#include <string>

#include "types.hpp"

namespace slide_reel {

/**
 * @brief MemReaderState: State for custom FFmpeg I/O from memory buffer.
 * @note Lets libavformat read a blob already held in RAM.
 */
struct MemReaderState {
  const uint8_t *ptr; //< Pointer to buffer start
  size_t size;        //< Total buffer size
  size_t pos;         //< Current read position
};

/**
 * @class MemoryReader
 * @brief FFmpeg custom I/O callbacks over a MemReaderState.
 */
class MemoryReader {
public:
  /// FFmpeg read callback; AVERROR_EOF at end of buffer
  static int read(void *opaque, uint8_t *buf, int buf_size);

  /// FFmpeg seek callback; handles AVSEEK_SIZE
  static int64_t seek(void *opaque, int64_t offset, int whence);
};

/**
 * @struct MediaInfo
 * @brief Stream layout of a probed container.
 * @note Codec names are libavcodec's short names ("h264", "aac").
 */
struct MediaInfo {
  double duration_seconds = 0.0;
  std::string container;
  std::string video_codec; //< Empty without a video stream
  int width = 0;
  int height = 0;
  std::string audio_codec; //< Empty without an audio stream
  int video_streams = 0;
  int audio_streams = 0;
};

/**
 * @class MediaProbe
 * @brief Opens a blob with custom I/O and reads its stream info.
 *
 * @attention MANAGEMENT:
 *
 *            - Uses AVFMT_FLAG_CUSTOM_IO; the AVIO context and its buffer
 *              are freed here, not by avformat_close_input
 *
 *            - Destructor handles partial initialization failures
 *
 * @note The blob must outlive the probe. One probe per thread.
 */
class MediaProbe {
public:
  explicit MediaProbe(const Blob &data);
  ~MediaProbe();

  MediaProbe(const MediaProbe &) = delete;
  MediaProbe &operator=(const MediaProbe &) = delete;

  /**
   * @brief Open the blob and gather stream info.
   * @return false if libavformat cannot recognize the data
   */
  bool open();

  /// Layout gathered by open()
  const MediaInfo &info() const { return info_; }

  /// libav error text of the last failure, empty if none
  const std::string &error() const { return error_; }

private:
  const Blob &data_;
  AVFormatContext *fmt_ctx_ = nullptr;
  AVIOContext *avio_ctx_ = nullptr;
  uint8_t *avio_buffer_ = nullptr;
  MemReaderState mem_state_{nullptr, 0, 0};
  MediaInfo info_;
  std::string error_;
};

/**
 * @brief Probe a blob in one call.
 * @return std::nullopt (with `error` filled when given) on failure
 */
std::optional<MediaInfo> probe_media(const Blob &data,
                                     std::string *error = nullptr);

/**
 * @brief Check an artifact against the fixed output profile.
 *
 * @attention REQUIRES:
 *
 *   - exactly one h264 video stream at OUTPUT_WIDTH x OUTPUT_HEIGHT
 *
 *   - exactly one aac audio stream
 *
 *   - duration within one frame plus one AAC frame of `expected_duration`
 *
 * @return Empty string when the artifact conforms, else the first mismatch
 */
std::string verify_artifact(const MediaInfo &info, double expected_duration);

} // namespace slide_reel

#endif // SLIDE_REEL_MEDIA_PROBE_HPP
