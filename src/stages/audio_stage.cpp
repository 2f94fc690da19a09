#include "stages/audio_stage.hpp"

#include <cerrno>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libswresample/swresample.h>
}

#include <alsa/asoundlib.h>

namespace fsp {

namespace {

constexpr int kOutChannels = 2;
constexpr unsigned kAlsaLatencyUs = 500000;

struct FormatCloser {
  void operator()(AVFormatContext* f) const { avformat_close_input(&f); }
};
struct CodecFreer {
  void operator()(AVCodecContext* c) const { avcodec_free_context(&c); }
};
struct SwrFreer {
  void operator()(SwrContext* s) const { swr_free(&s); }
};
struct PacketFreer {
  void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct FrameFreer {
  void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PcmCloser {
  void operator()(snd_pcm_t* p) const { snd_pcm_close(p); }
};

std::string AvErr(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

// Writes interleaved S16 stereo, recovering from underruns. Returns 0 or the unrecoverable ALSA error
int WritePcm(snd_pcm_t* pcm, const std::int16_t* data, std::size_t frames) {
  while (frames > 0) {
    snd_pcm_sframes_t n = snd_pcm_writei(pcm, data, frames);
    if (n == -EAGAIN) continue;
    if (n < 0) {
      const int err = snd_pcm_recover(pcm, static_cast<int>(n), 1);
      if (err < 0) return err;
      continue;
    }
    data += static_cast<std::size_t>(n) * kOutChannels;
    frames -= static_cast<std::size_t>(n);
  }
  return 0;
}

} // namespace

AudioStage::AudioStage(std::string path, std::string device)
    : Stage("audio"), path_(std::move(path)), device_(std::move(device)) {}

AudioStage::~AudioStage() {
  stop();
}

void AudioStage::fail(const std::string& what) {
  std::cerr << "[audio]: " << what << std::endl;
  failed_.store(true, std::memory_order_release);
}

void AudioStage::run(const StopToken& global, const std::atomic_bool& local) {
  auto should_stop = [&] {
    return global.stop_requested() || local.load(std::memory_order_relaxed);
  };

  AVFormatContext* raw_fmt = nullptr;
  int ret = avformat_open_input(&raw_fmt, path_.c_str(), nullptr, nullptr);
  if (ret < 0) return fail("Failed to open audio file " + path_ + ": " + AvErr(ret));
  std::unique_ptr<AVFormatContext, FormatCloser> fmt(raw_fmt);

  ret = avformat_find_stream_info(fmt.get(), nullptr);
  if (ret < 0) return fail("Failed to read stream info of " + path_ + ": " + AvErr(ret));

  const AVCodec* codec = nullptr;
  const int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0 || !codec) return fail("No audio stream in " + path_);

  std::unique_ptr<AVCodecContext, CodecFreer> dec(avcodec_alloc_context3(codec));
  if (!dec) return fail("Failed to allocate decoder");
  ret = avcodec_parameters_to_context(dec.get(), fmt->streams[stream_index]->codecpar);
  if (ret < 0) return fail("Failed to copy codec parameters: " + AvErr(ret));
  ret = avcodec_open2(dec.get(), codec, nullptr);
  if (ret < 0) return fail("Failed to open decoder: " + AvErr(ret));

  const int rate = dec->sample_rate;

  SwrContext* raw_swr = nullptr;
  AVChannelLayout stereo = AV_CHANNEL_LAYOUT_STEREO;
  ret = swr_alloc_set_opts2(&raw_swr, &stereo, AV_SAMPLE_FMT_S16, rate,
                            &dec->ch_layout, dec->sample_fmt, rate, 0, nullptr);
  if (ret < 0) return fail("Failed to configure resampler: " + AvErr(ret));
  std::unique_ptr<SwrContext, SwrFreer> swr(raw_swr);
  ret = swr_init(swr.get());
  if (ret < 0) return fail("Failed to init resampler: " + AvErr(ret));

  snd_pcm_t* raw_pcm = nullptr;
  ret = snd_pcm_open(&raw_pcm, device_.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
  if (ret < 0) return fail("Failed to open audio device " + device_ + ": " + snd_strerror(ret));
  std::unique_ptr<snd_pcm_t, PcmCloser> pcm(raw_pcm);
  ret = snd_pcm_set_params(pcm.get(), SND_PCM_FORMAT_S16_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                           kOutChannels, static_cast<unsigned>(rate), 1, kAlsaLatencyUs);
  if (ret < 0) return fail("Failed to configure audio device " + device_ + ": " + snd_strerror(ret));

  std::unique_ptr<AVPacket, PacketFreer> pkt(av_packet_alloc());
  std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
  if (!pkt || !frame) return fail("Failed to allocate packet/frame");

  std::cout << "[audio]: Playing " << path_ << " (" << rate << " Hz) on " << device_ << std::endl;

  std::vector<std::int16_t> pcm_buf;

  // Converts and plays whatever the resampler can give for 'in' (nullptr flushes it)
  auto play = [&](const AVFrame* in) -> bool {
    const int in_samples = in ? in->nb_samples : 0;
    const int max_out = swr_get_out_samples(swr.get(), in_samples);
    if (max_out <= 0) return true;

    pcm_buf.resize(static_cast<std::size_t>(max_out) * kOutChannels);
    std::uint8_t* out[1] = {reinterpret_cast<std::uint8_t*>(pcm_buf.data())};
    const int got = swr_convert(swr.get(), out, max_out,
                                in ? const_cast<const std::uint8_t**>(in->extended_data) : nullptr, in_samples);
    if (got < 0) {
      fail("Resample failed: " + AvErr(got));
      return false;
    }
    const int err = WritePcm(pcm.get(), pcm_buf.data(), static_cast<std::size_t>(got));
    if (err < 0) {
      fail(std::string("ALSA write failed: ") + snd_strerror(err));
      return false;
    }
    return true;
  };

  auto drain_decoder = [&]() -> bool {
    while (true) {
      const int r = avcodec_receive_frame(dec.get(), frame.get());
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
      if (r < 0) {
        fail("Decode failed: " + AvErr(r));
        return false;
      }
      const bool ok = play(frame.get());
      av_frame_unref(frame.get());
      if (!ok || should_stop()) return false;
    }
  };

  bool ok = true;
  while (ok && !should_stop()) {
    ret = av_read_frame(fmt.get(), pkt.get());
    if (ret == AVERROR_EOF) break;
    if (ret < 0) {
      fail("Failed to read " + path_ + ": " + AvErr(ret));
      ok = false;
      break;
    }
    if (pkt->stream_index == stream_index) {
      // Corrupt packets are skipped, the decoder resyncs on the next one
      if (avcodec_send_packet(dec.get(), pkt.get()) >= 0) ok = drain_decoder();
    }
    av_packet_unref(pkt.get());
  }

  if (should_stop()) {
    snd_pcm_drop(pcm.get());
    return;
  }

  // Flush the decoder and resampler tails
  if (ok && avcodec_send_packet(dec.get(), nullptr) >= 0) {
    ok = drain_decoder() && play(nullptr);
  }

  if (ok) {
    snd_pcm_drain(pcm.get());
  } else {
    snd_pcm_drop(pcm.get());
  }
}

} // namespace fsp
