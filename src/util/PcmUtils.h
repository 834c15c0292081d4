#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

class PcmUtils {
public:
    static constexpr double kPi = 3.14159265358979323846;

    // Little-endian signed 16-bit, independent of host byte order.
    static int16_t sampleAt(const char* data, size_t index) {
        const auto* p = reinterpret_cast<const uint8_t*>(data) + index * 2;
        return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                    (static_cast<uint16_t>(p[1]) << 8));
    }

    static void appendSample(std::vector<char>& out, int16_t sample) {
        auto u = static_cast<uint16_t>(sample);
        out.push_back(static_cast<char>(u & 0xFF));
        out.push_back(static_cast<char>((u >> 8) & 0xFF));
    }

    static std::vector<char> sine(double freqHz, double amplitude, int sampleRate,
                                  double durationS) {
        std::vector<char> out;
        size_t n = static_cast<size_t>(durationS * sampleRate);
        out.reserve(n * 2);
        for (size_t i = 0; i < n; ++i) {
            double v = amplitude * std::sin(2.0 * kPi * freqHz * i / sampleRate);
            appendSample(out, static_cast<int16_t>(v * 32767.0));
        }
        return out;
    }

    static std::vector<char> silence(int sampleRate, double durationS) {
        return std::vector<char>(static_cast<size_t>(durationS * sampleRate) * 2, 0);
    }
};
