#pragma once

#include <atomic>
#include <string>

#include "stages/stage.hpp"

namespace fsp {

// Plays one audio file start to finish on its own thread (FFmpeg decode, ALSA output).
// Not synchronized with video beyond being started after the warm-up delay.
// Any failure is logged and the thread ends, video keeps playing.
class AudioStage final : public Stage {
public:
  AudioStage(std::string path, std::string device);
  ~AudioStage() override;

  bool failed() const { return failed_.load(std::memory_order_acquire); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  void fail(const std::string& what);

  std::string path_;
  std::string device_;
  std::atomic_bool failed_{false};
};

} // namespace fsp
