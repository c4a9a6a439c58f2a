/**
 * @file ffmpeg_frame_extractor.cpp
 * @brief libav decode, uniform sampling and RGB24 conversion
 *
 * @details Frames are decoded in stream order; the sampled ones are scaled
 *          once with libswscale straight into the output buffer.
 */

#include "caption_suite/ffmpeg_frame_extractor.hpp"

#include <cerrno>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libswscale/swscale.h>
}

#include <fmt/core.h>

#include "caption_suite/errors.hpp"

namespace caption_suite {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

/**
 * @class VideoDecoder
 * @brief Owns the FFmpeg contexts for one extract() call.
 *
 * @attention MANAGEMENT:
 *
 *            - open() may fail half way; the destructor frees whatever was
 *              allocated
 *
 *            - All FFmpeg resources are freed in reverse allocation order
 */
class VideoDecoder {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  SwsContext *sws_ctx = nullptr;
  int video_stream_idx = -1;
  std::string path;

public:
  explicit VideoDecoder(std::string media_path) : path(std::move(media_path)) {
    frame = av_frame_alloc();
    pkt = av_packet_alloc();
  }

  ~VideoDecoder() {
    if (sws_ctx)
      sws_freeContext(sws_ctx);
    if (dec_ctx)
      avcodec_free_context(&dec_ctx);
    if (fmt_ctx)
      avformat_close_input(&fmt_ctx);
    av_frame_free(&frame);
    av_packet_free(&pkt);
  }

  VideoDecoder(const VideoDecoder &) = delete;
  VideoDecoder &operator=(const VideoDecoder &) = delete;

  /**
   * @brief Open the container and the decoder of its best video stream.
   * @throws DecodeError on any libav failure
   */
  void open() {
    if (!frame || !pkt)
      throw DecodeError("Failed to allocate AVFrame/AVPacket");

    int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
      throw DecodeError(
          fmt::format("Cannot open video: {} ({})", path, av_error_string(ret)));
    }

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0) {
      throw DecodeError(fmt::format("Cannot read stream info: {} ({})", path,
                                    av_error_string(ret)));
    }

    video_stream_idx =
        av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (video_stream_idx < 0)
      throw DecodeError(fmt::format("No video stream found: {}", path));

    /// Discard non-video streams to save demuxing time
    for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
      if (i != static_cast<unsigned int>(video_stream_idx)) {
        fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
      }
    }

    AVCodecParameters *param = fmt_ctx->streams[video_stream_idx]->codecpar;
    const AVCodec *codec = avcodec_find_decoder(param->codec_id);
    if (!codec) {
      throw DecodeError(fmt::format("No decoder found for codec ID {}: {}",
                                    static_cast<int>(param->codec_id), path));
    }

    dec_ctx = avcodec_alloc_context3(codec);
    if (!dec_ctx)
      throw DecodeError("Failed to allocate decoder context");

    ret = avcodec_parameters_to_context(dec_ctx, param);
    if (ret < 0) {
      throw DecodeError(fmt::format("Bad codec parameters: {} ({})", path,
                                    av_error_string(ret)));
    }

    /// One extractor per worker; keep decoder threads low
    dec_ctx->thread_count = 2;

    ret = avcodec_open2(dec_ctx, codec, nullptr);
    if (ret < 0) {
      throw DecodeError(fmt::format("avcodec_open2 failed: {} ({})", path,
                                    av_error_string(ret)));
    }
  }

  double time_base() const {
    return av_q2d(fmt_ctx->streams[video_stream_idx]->time_base);
  }

  double fps() const {
    AVRational r = fmt_ctx->streams[video_stream_idx]->avg_frame_rate;
    return (r.den > 0 && r.num > 0) ? av_q2d(r) : 0.0;
  }

  double duration() const {
    return (fmt_ctx->duration != AV_NOPTS_VALUE)
               ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
               : 0.0;
  }

  int width() const { return dec_ctx->width; }
  int height() const { return dec_ctx->height; }

  /**
   * @brief Number of frames in the video stream.
   * @note Uses the container's count when present, otherwise counts video
   *       packets and rewinds.
   */
  int64_t count_frames() {
    int64_t declared = fmt_ctx->streams[video_stream_idx]->nb_frames;
    if (declared > 0)
      return declared;

    int64_t packets = 0;
    while (av_read_frame(fmt_ctx, pkt) >= 0) {
      if (pkt->stream_index == video_stream_idx)
        packets++;
      av_packet_unref(pkt);
    }

    int ret = av_seek_frame(fmt_ctx, video_stream_idx, 0, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
      throw DecodeError(fmt::format("Cannot rewind after counting: {} ({})",
                                    path, av_error_string(ret)));
    }
    avcodec_flush_buffers(dec_ctx);
    return packets;
  }

  /**
   * @brief Decode every frame in order.
   * @param visit Called as visit(frame, index); returns false to stop early
   */
  template <typename Visit> void decode(Visit &&visit) {
    int64_t index = 0;
    bool keep_going = true;

    auto drain = [&]() {
      while (keep_going) {
        int recv_ret = avcodec_receive_frame(dec_ctx, frame);
        if (recv_ret == AVERROR(EAGAIN) || recv_ret == AVERROR_EOF)
          return;
        if (recv_ret < 0) {
          throw DecodeError(fmt::format("Decode failed: {} ({})", path,
                                        av_error_string(recv_ret)));
        }
        keep_going = visit(frame, index++);
        av_frame_unref(frame);
      }
    };

    while (keep_going && av_read_frame(fmt_ctx, pkt) >= 0) {
      if (pkt->stream_index == video_stream_idx) {
        int send_ret = avcodec_send_packet(dec_ctx, pkt);
        av_packet_unref(pkt);
        /// A corrupt packet is skipped, the stream may still recover
        if (send_ret >= 0)
          drain();
      } else {
        av_packet_unref(pkt);
      }
    }

    /// Flush frames still buffered in the decoder
    if (keep_going && avcodec_send_packet(dec_ctx, nullptr) >= 0)
      drain();
  }

  /**
   * @brief Scale one decoded frame to RGB24.
   */
  Frame convert(const AVFrame *src, int out_width, int out_height,
                double timestamp) {
    sws_ctx = sws_getCachedContext(
        sws_ctx, src->width, src->height,
        static_cast<AVPixelFormat>(src->format), out_width, out_height,
        AV_PIX_FMT_RGB24, SWS_BICUBIC, nullptr, nullptr, nullptr);
    if (!sws_ctx) {
      throw DecodeError(fmt::format("Cannot convert {}x{} frame: {}",
                                    src->width, src->height, path));
    }

    Frame out;
    out.width = out_width;
    out.height = out_height;
    out.timestamp = timestamp;
    out.rgb.resize(static_cast<std::size_t>(out_width) * out_height * 3);

    uint8_t *dst[4] = {out.rgb.data(), nullptr, nullptr, nullptr};
    int dst_linesize[4] = {out_width * 3, 0, 0, 0};
    sws_scale(sws_ctx, src->data, src->linesize, 0, src->height, dst,
              dst_linesize);
    return out;
  }
};

} // anonymous namespace

std::vector<Frame>
FFmpegFrameExtractor::extract(const std::string &path,
                              const ExtractionLimits &limits,
                              VideoMetadata &metadata,
                              const FrameCallback &on_frame) {
  VideoDecoder decoder(path);
  decoder.open();

  const int64_t total = decoder.count_frames();
  if (total <= 0)
    throw DecodeError(fmt::format("Video has no frames: {}", path));

  const std::vector<int64_t> wanted = sample_indices(total, limits.max_frames);
  const int target = static_cast<int>(wanted.size());
  const double time_base = decoder.time_base();
  const double fps = decoder.fps();

  std::vector<Frame> frames;
  frames.reserve(wanted.size());
  std::size_t next = 0;

  decoder.decode([&](const AVFrame *f, int64_t index) {
    if (index == wanted[next]) {
      double ts = (f->best_effort_timestamp != AV_NOPTS_VALUE)
                      ? f->best_effort_timestamp * time_base
                      : (fps > 0 ? index / fps : 0.0);
      int out_w = 0;
      int out_h = 0;
      fit_frame_size(f->width, f->height, limits.frame_size, out_w, out_h);
      frames.push_back(decoder.convert(f, out_w, out_h, ts));
      ++next;
    }
    if (on_frame && !on_frame(static_cast<int>(frames.size()), target))
      throw StoppedError();
    return next < wanted.size();
  });

  if (frames.empty()) {
    throw DecodeError(
        fmt::format("Could not extract any frames from: {}", path));
  }

  metadata.width = decoder.width();
  metadata.height = decoder.height();
  metadata.fps = fps;
  metadata.frame_count = total;
  metadata.duration = decoder.duration();
  metadata.frames_extracted = static_cast<int>(frames.size());
  return frames;
}

} // namespace caption_suite
