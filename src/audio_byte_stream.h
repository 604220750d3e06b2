#pragma once

#include <cstdint>
#include <vector>

#include "common.h"

// Re-frames an arbitrarily chunked little-endian 16-bit PCM byte stream into frames of a fixed number of
// samples per channel. Bytes that do not complete a frame stay buffered until the next write or the flush.
class audio_byte_stream {
public:
    // samples_per_channel defaults to 100ms of audio when left at 0.
    audio_byte_stream(uint32_t sample_rate, uint32_t num_channels, uint32_t samples_per_channel = 0);

    vector<audio_frame> write(const char * data, size_t length);
    vector<audio_frame> write(const vector<uint8_t> & data);

    // Emits whatever whole samples remain as one short frame. A trailing partial sample is dropped.
    vector<audio_frame> flush();

    size_t buffered_bytes() const { return buf.size(); }
    size_t bytes_per_frame() const { return _bytes_per_frame; }
    uint32_t samples_per_channel() const { return _samples_per_channel; }

private:
    audio_frame decode_frame(size_t offset, size_t n_bytes) const;

    const uint32_t sample_rate;
    const uint32_t num_channels;
    const uint32_t _samples_per_channel;
    const size_t _bytes_per_frame;
    vector<uint8_t> buf;
};
