/**
 * @file media_probe.cpp
 * @brief In-memory media probing implementation
 */

#include "slide_reel/media_probe.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavformat/avio.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
}

#include <fmt/core.h>

namespace slide_reel {

namespace {

std::string av_error_text(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // namespace

// **---- MemoryReader Implementation ----**

int MemoryReader::read(void *opaque, uint8_t *buf, int buf_size) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);
  size_t bytes_left = bd->size - bd->pos;
  if (bytes_left == 0)
    return AVERROR_EOF;
  size_t copy = std::min(bytes_left, static_cast<size_t>(buf_size));
  memcpy(buf, bd->ptr + bd->pos, copy);
  bd->pos += copy;
  return static_cast<int>(copy);
}

int64_t MemoryReader::seek(void *opaque, int64_t offset, int whence) {
  MemReaderState *bd = static_cast<MemReaderState *>(opaque);

  if (whence & AVSEEK_SIZE)
    return static_cast<int64_t>(bd->size);

  int64_t new_pos = static_cast<int64_t>(bd->pos);
  switch (whence & ~AVSEEK_FORCE) {
  case SEEK_SET:
    new_pos = offset;
    break;
  case SEEK_CUR:
    new_pos += offset;
    break;
  case SEEK_END:
    new_pos = static_cast<int64_t>(bd->size) + offset;
    break;
  default:
    return AVERROR(EINVAL);
  }

  new_pos = std::max<int64_t>(0, std::min<int64_t>(new_pos, bd->size));
  bd->pos = static_cast<size_t>(new_pos);
  return new_pos;
}

// **---- MediaProbe Implementation ----**

MediaProbe::MediaProbe(const Blob &data) : data_(data) {}

MediaProbe::~MediaProbe() {
  if (fmt_ctx_)
    avformat_close_input(&fmt_ctx_);

  if (avio_ctx_) {
    /// The context may have swapped its buffer; free whatever it holds now
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  } else if (avio_buffer_) {
    av_free(avio_buffer_);
  }
}

bool MediaProbe::open() {
  if (data_.empty()) {
    error_ = "empty blob";
    return false;
  }

  fmt_ctx_ = avformat_alloc_context();
  if (!fmt_ctx_) {
    error_ = "failed to allocate AVFormatContext";
    return false;
  }

  avio_buffer_ = static_cast<uint8_t *>(av_malloc(AVIO_BUFFER_SIZE));
  if (!avio_buffer_) {
    error_ = "failed to allocate AVIO buffer";
    return false;
  }

  mem_state_ = {data_.data(), data_.size(), 0};

  avio_ctx_ = avio_alloc_context(avio_buffer_, AVIO_BUFFER_SIZE, 0, &mem_state_,
                                 MemoryReader::read, nullptr,
                                 MemoryReader::seek);
  if (!avio_ctx_) {
    error_ = "failed to allocate AVIOContext";
    return false;
  }

  fmt_ctx_->pb = avio_ctx_;
  fmt_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  /// On failure avformat_open_input frees fmt_ctx_ and nulls it
  int err = avformat_open_input(&fmt_ctx_, "RAM", nullptr, nullptr);
  if (err < 0) {
    error_ = fmt::format("avformat_open_input: {}", av_error_text(err));
    return false;
  }

  err = avformat_find_stream_info(fmt_ctx_, nullptr);
  if (err < 0) {
    error_ = fmt::format("avformat_find_stream_info: {}", av_error_text(err));
    return false;
  }

  info_ = MediaInfo{};
  if (fmt_ctx_->iformat && fmt_ctx_->iformat->name)
    info_.container = fmt_ctx_->iformat->name;
  if (fmt_ctx_->duration != AV_NOPTS_VALUE)
    info_.duration_seconds =
        static_cast<double>(fmt_ctx_->duration) / AV_TIME_BASE;

  for (unsigned int i = 0; i < fmt_ctx_->nb_streams; i++) {
    const AVCodecParameters *par = fmt_ctx_->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      /// Attached pictures (cover art) are not part of the timeline
      if (fmt_ctx_->streams[i]->disposition & AV_DISPOSITION_ATTACHED_PIC)
        continue;
      if (info_.video_streams++ == 0) {
        info_.video_codec = avcodec_get_name(par->codec_id);
        info_.width = par->width;
        info_.height = par->height;
      }
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      if (info_.audio_streams++ == 0)
        info_.audio_codec = avcodec_get_name(par->codec_id);
    }
  }
  return true;
}

std::optional<MediaInfo> probe_media(const Blob &data, std::string *error) {
  MediaProbe probe(data);
  if (!probe.open()) {
    if (error)
      *error = probe.error();
    return std::nullopt;
  }
  return probe.info();
}

std::string verify_artifact(const MediaInfo &info, double expected_duration) {
  if (info.video_streams != 1)
    return fmt::format("expected 1 video stream, found {}", info.video_streams);
  if (info.video_codec != "h264")
    return fmt::format("video codec {} is not h264", info.video_codec);
  if (info.width != OUTPUT_WIDTH || info.height != OUTPUT_HEIGHT)
    return fmt::format("frame size {}x{} is not {}x{}", info.width, info.height,
                       OUTPUT_WIDTH, OUTPUT_HEIGHT);
  if (info.audio_streams != 1)
    return fmt::format("expected 1 audio stream, found {}", info.audio_streams);
  if (info.audio_codec != "aac")
    return fmt::format("audio codec {} is not aac", info.audio_codec);

  double tolerance = 1.0 / OUTPUT_FPS + AAC_FRAME_SECONDS;
  double drift = std::fabs(info.duration_seconds - expected_duration);
  if (drift > tolerance)
    return fmt::format("duration {:.3f}s differs from {:.3f}s by {:.3f}s",
                       info.duration_seconds, expected_duration, drift);
  return "";
}

} // namespace slide_reel
