#include "audio_byte_stream.h"

audio_byte_stream::audio_byte_stream(uint32_t sample_rate, uint32_t num_channels, uint32_t samples_per_channel):
    sample_rate(sample_rate),
    num_channels(num_channels),
    _samples_per_channel(samples_per_channel > 0 ? samples_per_channel : sample_rate / 10),
    _bytes_per_frame(static_cast<size_t>(num_channels) * _samples_per_channel * sizeof(int16_t)) {
    KOKORO_ASSERT(sample_rate > 0);
    KOKORO_ASSERT(num_channels > 0);
    KOKORO_ASSERT(_samples_per_channel > 0);
}

vector<audio_frame> audio_byte_stream::write(const char * data, size_t length) {
    buf.insert(buf.end(), reinterpret_cast<const uint8_t *>(data), reinterpret_cast<const uint8_t *>(data) + length);

    vector<audio_frame> frames;
    size_t consumed = 0;
    while (buf.size() - consumed >= _bytes_per_frame) {
        frames.push_back(decode_frame(consumed, _bytes_per_frame));
        consumed += _bytes_per_frame;
    }
    buf.erase(buf.begin(), buf.begin() + consumed);
    return frames;
}

vector<audio_frame> audio_byte_stream::write(const vector<uint8_t> & data) {
    return write(reinterpret_cast<const char *>(data.data()), data.size());
}

vector<audio_frame> audio_byte_stream::flush() {
    const size_t sample_bytes = num_channels * sizeof(int16_t);
    const size_t remainder = buf.size() % sample_bytes;
    if (remainder != 0) {
        KOKORO_LOG_WARN("audio_byte_stream: dropping %zu byte(s) of an incomplete sample during flush", remainder);
    }

    vector<audio_frame> frames;
    const size_t whole = buf.size() - remainder;
    if (whole > 0) {
        frames.push_back(decode_frame(0, whole));
    }
    buf.clear();
    return frames;
}

// samples on the wire are little-endian regardless of the host's byte order.
audio_frame audio_byte_stream::decode_frame(size_t offset, size_t n_bytes) const {
    vector<int16_t> data(n_bytes / sizeof(int16_t));
    const uint8_t * src = buf.data() + offset;
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<int16_t>(src[2 * i] | (src[2 * i + 1] << 8));
    }
    const uint32_t samples_per_channel = static_cast<uint32_t>(data.size() / num_channels);
    return audio_frame(std::move(data), sample_rate, num_channels, samples_per_channel);
}
