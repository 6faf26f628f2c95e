#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ntm {

class IFileStore;

namespace audio {

constexpr int kDefaultSampleRate = 44100;
constexpr double kDefaultAmplitude = 0.5;

// Sine tone as 16-bit samples: int(sampleRate * durationSeconds) samples of
// amplitude * sin(2*pi*f*t), scaled by 32767 and truncated toward zero.
// ValidationError when frequency, duration or sample rate is not positive or
// amplitude is outside [0, 1].
std::vector<std::int16_t> GenerateTone(double frequencyHz, double durationSeconds,
                                       double amplitude = kDefaultAmplitude,
                                       int sampleRate = kDefaultSampleRate);

// Canonical 44-byte RIFF/WAVE header, mono 16-bit PCM, little-endian.
std::string EncodeWav(const std::vector<std::int16_t>& samples, int sampleRate = kDefaultSampleRate);

void SaveTone(const std::vector<std::int16_t>& samples, const std::string& path, IFileStore& store,
              int sampleRate = kDefaultSampleRate);

// "tone_440Hz.wav", "tone_440.5Hz.wav"
std::string ToneFileName(double frequencyHz, const std::string& prefix = "tone");

// One file per frequency in [startHz, endHz] stepping by stepHz, written into
// outputDir (created when missing). Returns the written paths.
std::vector<std::string> GenerateFrequencyRange(double startHz, double endHz, double stepHz,
                                                double durationSeconds, const std::string& outputDir,
                                                IFileStore& store,
                                                double amplitude = kDefaultAmplitude,
                                                const std::string& prefix = "tone",
                                                int sampleRate = kDefaultSampleRate);

} // namespace audio
} // namespace ntm
