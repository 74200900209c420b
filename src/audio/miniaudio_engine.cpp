// src/audio/miniaudio_engine.cpp
// Sample-accurate event rendering with miniaudio + TinySoundFont.
// The device callback owns the clock: it advances only by rendered frames, so
// the clock stops while the device is stopped (suspended).

#define TSF_IMPLEMENTATION
#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"
#include "tsf.h"

#include "audio/miniaudio_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr double kTwoPi = 6.283185307179586;

enum class EvKind { NoteOn, NoteOff, Click };

// One thing to do at an exact frame.
struct PendingEvent {
  std::uint64_t frame;
  EvKind kind;
  audio::VoiceHandle voice; // kNoVoice for clicks
  std::uint8_t note;
  std::uint8_t vel;
  bool accent;
};

// A click in flight: 800 Hz accented / 400 Hz plain, 1 ms attack to 0.3,
// exponential decay to 0.001 at 100 ms.
struct ClickVoice {
  double freq = 400.0;
  std::uint64_t age = 0; // frames since onset
};

struct VoiceInfo {
  std::uint8_t note = 0;
  bool sounding = false;
};

} // namespace

namespace audio {

struct MiniaudioEngine::Impl {
  std::optional<std::filesystem::path> soundFont;
  ma_uint32 sampleRate = 44100;

  ma_device device{};
  bool deviceReady = false;
  bool started = false;
  tsf *synth = nullptr;

  // Shared with the audio thread.
  std::mutex mtx;
  std::vector<PendingEvent> pending; // ascending by frame
  std::vector<ClickVoice> clicks;
  std::unordered_map<VoiceHandle, VoiceInfo> voices;
  std::atomic<std::uint64_t> framesRendered{0};
  VoiceHandle nextVoice = 1;

  std::uint64_t to_frame(double seconds) const {
    if (seconds <= 0.0)
      return 0;
    return static_cast<std::uint64_t>(std::llround(seconds * sampleRate));
  }

  void enqueue(const PendingEvent &ev) {
    auto pos = std::upper_bound(
        pending.begin(), pending.end(), ev.frame,
        [](std::uint64_t f, const PendingEvent &p) { return f < p.frame; });
    pending.insert(pos, ev);
  }

  void apply(const PendingEvent &ev) {
    switch (ev.kind) {
    case EvKind::Click:
      clicks.push_back(ClickVoice{ev.accent ? 800.0 : 400.0, 0});
      break;
    case EvKind::NoteOn: {
      auto it = voices.find(ev.voice);
      if (it != voices.end())
        it->second.sounding = true;
      if (synth)
        tsf_channel_note_on(synth, 0, ev.note, ev.vel / 127.0f);
      break;
    }
    case EvKind::NoteOff:
      voices.erase(ev.voice);
      if (synth)
        tsf_channel_note_off(synth, 0, ev.note);
      break;
    }
  }

  // Render `count` stereo frames of synth + clicks into out (interleaved).
  void render(float *out, ma_uint32 count) {
    if (synth) {
      tsf_render_float(synth, out, static_cast<int>(count), 0);
    } else {
      std::fill(out, out + count * 2, 0.0f);
    }

    const double attack = 0.001 * sampleRate;
    const double decay = 0.1 * sampleRate;
    for (auto &c : clicks) {
      for (ma_uint32 i = 0; i < count && c.age < decay; ++i, ++c.age) {
        const double t = static_cast<double>(c.age);
        double gain = 0.0;
        if (t < attack) {
          gain = 0.3 * (t / attack);
        } else {
          // 0.3 -> 0.001 exponentially over the remaining window
          gain = 0.3 * std::pow(0.001 / 0.3, (t - attack) / (decay - attack));
        }
        const float s = static_cast<float>(
            gain * std::sin(kTwoPi * c.freq * t / sampleRate));
        out[i * 2] += s;
        out[i * 2 + 1] += s;
      }
    }
    clicks.erase(std::remove_if(clicks.begin(), clicks.end(),
                                [decay](const ClickVoice &c) {
                                  return c.age >= decay;
                                }),
                 clicks.end());
  }

  static void data_callback(ma_device *device, void *pOutput,
                            const void *pInput, ma_uint32 frameCount);
};

// Real-time callback: split the buffer at every due event so each lands on its
// exact frame.
void MiniaudioEngine::Impl::data_callback(ma_device *device, void *pOutput,
                                          const void * /*pInput*/,
                                          ma_uint32 frameCount) {
  auto *impl = reinterpret_cast<Impl *>(device->pUserData);
  float *out = reinterpret_cast<float *>(pOutput);

  std::lock_guard<std::mutex> lock(impl->mtx);
  const std::uint64_t f0 = impl->framesRendered.load(std::memory_order_relaxed);
  const std::uint64_t f1 = f0 + frameCount;

  ma_uint32 pos = 0;
  std::size_t applied = 0;
  while (pos < frameCount) {
    ma_uint32 until = frameCount;
    while (applied < impl->pending.size() &&
           impl->pending[applied].frame <= f0 + pos) {
      impl->apply(impl->pending[applied++]);
    }
    if (applied < impl->pending.size() && impl->pending[applied].frame < f1) {
      until = static_cast<ma_uint32>(impl->pending[applied].frame - f0);
    }
    impl->render(out + pos * 2, until - pos);
    pos = until;
  }
  impl->pending.erase(impl->pending.begin(),
                      impl->pending.begin() + static_cast<long>(applied));

  impl->framesRendered.store(f1, std::memory_order_relaxed);
}


MiniaudioEngine::MiniaudioEngine(std::optional<std::filesystem::path> soundFont,
                                 unsigned sampleRate)
    : impl_(std::make_unique<Impl>()) {
  impl_->soundFont = std::move(soundFont);
  impl_->sampleRate = sampleRate;
}

MiniaudioEngine::~MiniaudioEngine() {
  if (impl_->deviceReady) {
    ma_device_uninit(&impl_->device);
  }
  if (impl_->synth) {
    tsf_close(impl_->synth);
  }
}

void MiniaudioEngine::start() {
  if (!impl_->deviceReady) {
    if (impl_->soundFont) {
      impl_->synth = tsf_load_filename(impl_->soundFont->string().c_str());
      if (!impl_->synth) {
        throw AudioEngineError("Failed to load SoundFont (.sf2): " +
                               impl_->soundFont->string());
      }
      tsf_set_output(impl_->synth, TSF_STEREO_INTERLEAVED,
                     static_cast<int>(impl_->sampleRate), 0.0f);
      tsf_set_volume(impl_->synth, 0.8f); // modest headroom
      tsf_channel_set_presetnumber(impl_->synth, 0, 0 /*Acoustic Grand*/, 0);
    } else {
      spdlog::warn("no SoundFont given: notes will keep time but stay silent");
    }

    ma_device_config config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32; // matches tsf_render_float
    config.playback.channels = 2;
    config.sampleRate = impl_->sampleRate;
    config.dataCallback = Impl::data_callback;
    config.pUserData = impl_.get();

    if (ma_device_init(nullptr, &config, &impl_->device) != MA_SUCCESS) {
      throw AudioEngineError("Failed to open playback device");
    }
    impl_->deviceReady = true;
    spdlog::debug("audio device open at {} Hz", impl_->sampleRate);
  }
  if (!impl_->started) {
    resume();
  }
}

bool MiniaudioEngine::running() const { return impl_->started; }

double MiniaudioEngine::current_time() const {
  return static_cast<double>(
             impl_->framesRendered.load(std::memory_order_relaxed)) /
         impl_->sampleRate;
}

void MiniaudioEngine::schedule_click(double when, bool accent) {
  std::lock_guard<std::mutex> lock(impl_->mtx);
  impl_->enqueue(PendingEvent{impl_->to_frame(when), EvKind::Click, kNoVoice,
                              0, 0, accent});
}

VoiceHandle MiniaudioEngine::schedule_note(double when, std::uint8_t note,
                                           std::uint8_t velocity,
                                           double sustain) {
  std::lock_guard<std::mutex> lock(impl_->mtx);
  const VoiceHandle voice = impl_->nextVoice++;
  impl_->voices.emplace(voice, VoiceInfo{note, false});
  const std::uint64_t on = impl_->to_frame(when);
  const std::uint64_t off = std::max(on, impl_->to_frame(when + sustain));
  impl_->enqueue(PendingEvent{on, EvKind::NoteOn, voice, note, velocity, false});
  impl_->enqueue(PendingEvent{off, EvKind::NoteOff, voice, note, 0, false});
  return voice;
}

void MiniaudioEngine::cancel(VoiceHandle voice) {
  std::lock_guard<std::mutex> lock(impl_->mtx);
  auto it = impl_->voices.find(voice);
  if (it == impl_->voices.end())
    return; // already finished
  const VoiceInfo info = it->second;
  impl_->voices.erase(it);

  auto &pending = impl_->pending;
  pending.erase(std::remove_if(pending.begin(), pending.end(),
                               [voice](const PendingEvent &p) {
                                 return p.voice == voice;
                               }),
                pending.end());
  if (info.sounding && impl_->synth) {
    tsf_channel_note_off(impl_->synth, 0, info.note);
  }
}

void MiniaudioEngine::suspend() {
  if (!impl_->started)
    return;
  if (ma_device_stop(&impl_->device) != MA_SUCCESS) {
    spdlog::warn("audio device did not stop cleanly");
  }
  impl_->started = false;
}

void MiniaudioEngine::resume() {
  if (impl_->started || !impl_->deviceReady)
    return;
  // One retry: a device can be briefly busy right after a stop.
  for (int attempt = 0; attempt < 2; ++attempt) {
    if (ma_device_start(&impl_->device) == MA_SUCCESS) {
      impl_->started = true;
      return;
    }
    spdlog::warn("audio device start failed (attempt {})", attempt + 1);
  }
  throw AudioEngineError("Failed to start playback device");
}

} // namespace audio
