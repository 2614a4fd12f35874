#pragma once

#include <cstdint>
#include <span>
#include <vector>

// In-memory RIFF/WAVE container for mono 16-bit PCM, written little-endian
// regardless of host byte order.
namespace wav {

inline constexpr size_t header_size = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    constexpr uint16_t block_align = channels * bits_per_sample / 8;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * block_align);

    std::vector<uint8_t> out;
    out.reserve(header_size + data_size);

    auto tag = [&out](const char (&s)[5]) { out.insert(out.end(), s, s + 4); };
    auto le16 = [&out](uint16_t v) {
        out.push_back(static_cast<uint8_t>(v));
        out.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto le32 = [&le16](uint32_t v) {
        le16(static_cast<uint16_t>(v));
        le16(static_cast<uint16_t>(v >> 16));
    };

    tag("RIFF");
    le32(36 + data_size);
    tag("WAVE");

    tag("fmt ");
    le32(16);
    le16(1); // PCM
    le16(channels);
    le32(sample_rate);
    le32(sample_rate * block_align);
    le16(block_align);
    le16(bits_per_sample);

    tag("data");
    le32(data_size);
    for (int16_t s : samples) {
        le16(static_cast<uint16_t>(s));
    }

    return out;
}

} // namespace wav
