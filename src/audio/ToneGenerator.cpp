#include "audio/ToneGenerator.h"
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include "core/Errors.h"
#include "core/Logger.h"
#include "io/FileSystem.h"

namespace ntm {
namespace audio {

namespace {
    constexpr double kPi = 3.14159265358979323846;

    void PutU16(std::string& out, std::uint16_t v)
    {
        out.push_back(static_cast<char>(v & 0xFF));
        out.push_back(static_cast<char>((v >> 8) & 0xFF));
    }

    void PutU32(std::string& out, std::uint32_t v)
    {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }

    std::string FormatNumber(double v)
    {
        std::ostringstream ss; ss << v;
        return ss.str();
    }
}

std::vector<std::int16_t> GenerateTone(double frequencyHz, double durationSeconds, double amplitude, int sampleRate)
{
    if (!(frequencyHz > 0.0)) throw ValidationError("Tone frequency must be > 0 (got " + FormatNumber(frequencyHz) + ")");
    if (!(durationSeconds > 0.0)) throw ValidationError("Tone duration must be > 0 (got " + FormatNumber(durationSeconds) + ")");
    if (!(amplitude >= 0.0 && amplitude <= 1.0)) throw ValidationError("Tone amplitude must be between 0 and 1 (got " + FormatNumber(amplitude) + ")");
    if (sampleRate <= 0) throw ValidationError("Sample rate must be > 0 (got " + std::to_string(sampleRate) + ")");

    const size_t count = static_cast<size_t>(static_cast<double>(sampleRate) * durationSeconds);
    std::vector<std::int16_t> samples(count);
    for (size_t i = 0; i < count; ++i) {
        double t = static_cast<double>(i) / sampleRate;
        double v = amplitude * std::sin(2.0 * kPi * frequencyHz * t);
        samples[i] = static_cast<std::int16_t>(v * 32767.0);
    }
    return samples;
}

std::string EncodeWav(const std::vector<std::int16_t>& samples, int sampleRate)
{
    const std::uint16_t channels = 1;
    const std::uint16_t bitsPerSample = 16;
    const std::uint16_t blockAlign = channels * bitsPerSample / 8;
    const std::uint32_t byteRate = static_cast<std::uint32_t>(sampleRate) * blockAlign;
    const std::uint32_t dataSize = static_cast<std::uint32_t>(samples.size() * blockAlign);

    std::string out;
    out.reserve(44 + dataSize);
    out += "RIFF";
    PutU32(out, 36 + dataSize);
    out += "WAVE";
    out += "fmt ";
    PutU32(out, 16);        // PCM fmt chunk size
    PutU16(out, 1);         // PCM
    PutU16(out, channels);
    PutU32(out, static_cast<std::uint32_t>(sampleRate));
    PutU32(out, byteRate);
    PutU16(out, blockAlign);
    PutU16(out, bitsPerSample);
    out += "data";
    PutU32(out, dataSize);
    for (std::int16_t s : samples) PutU16(out, static_cast<std::uint16_t>(s));
    return out;
}

void SaveTone(const std::vector<std::int16_t>& samples, const std::string& path, IFileStore& store, int sampleRate)
{
    store.WriteTextFile(path, EncodeWav(samples, sampleRate));
    Logger::Log("[Tone] Wrote " + std::to_string(samples.size()) + " samples to " + path);
}

std::string ToneFileName(double frequencyHz, const std::string& prefix)
{
    std::ostringstream ss;
    ss << prefix << '_';
    if (std::floor(frequencyHz) == frequencyHz)
        ss << static_cast<long long>(frequencyHz);
    else
        ss << std::fixed << std::setprecision(1) << frequencyHz;
    ss << "Hz.wav";
    return ss.str();
}

std::vector<std::string> GenerateFrequencyRange(double startHz, double endHz, double stepHz,
                                                double durationSeconds, const std::string& outputDir,
                                                IFileStore& store, double amplitude,
                                                const std::string& prefix, int sampleRate)
{
    if (!(stepHz > 0.0)) throw ValidationError("Frequency step must be > 0 (got " + FormatNumber(stepHz) + ")");
    if (endHz < startHz) throw ValidationError("End frequency must not be below start frequency");

    if (!outputDir.empty() && !store.Exists(outputDir)) store.CreateDirectories(outputDir);

    // Same element count as a half-open range [start, end + step)
    const auto count = static_cast<size_t>(std::ceil((endHz + stepHz - startHz) / stepHz));
    std::vector<std::string> written;
    written.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        double freq = startHz + static_cast<double>(i) * stepHz;
        std::string path = outputDir.empty() ? ToneFileName(freq, prefix)
                                             : (std::filesystem::path(outputDir) / ToneFileName(freq, prefix)).string();
        SaveTone(GenerateTone(freq, durationSeconds, amplitude, sampleRate), path, store, sampleRate);
        written.push_back(std::move(path));
    }
    return written;
}

} // namespace audio
} // namespace ntm
