#include "common.h"

audio_frame::audio_frame(vector<int16_t> data, uint32_t sample_rate, uint32_t num_channels, uint32_t samples_per_channel):
    data(std::move(data)), sample_rate(sample_rate), num_channels(num_channels), samples_per_channel(samples_per_channel) {
    KOKORO_ASSERT(this->data.size() == static_cast<size_t>(num_channels) * samples_per_channel);
}

double audio_frame::duration() const {
    return sample_rate == 0 ? 0.0 : (double) samples_per_channel / sample_rate;
}

audio_frame combine_audio_frames(const vector<audio_frame> & frames) {
    if (frames.empty()) {
        return audio_frame{};
    }
    const uint32_t sample_rate = frames[0].sample_rate;
    const uint32_t num_channels = frames[0].num_channels;
    size_t total = 0;
    uint32_t samples_per_channel = 0;
    for (const auto & frame : frames) {
        if (frame.sample_rate != sample_rate || frame.num_channels != num_channels) {
            KOKORO_ABORT("%s: cannot combine frames of %u Hz x %u channels with frames of %u Hz x %u channels",
                         __func__, frame.sample_rate, frame.num_channels, sample_rate, num_channels);
        }
        total += frame.data.size();
        samples_per_channel += frame.samples_per_channel;
    }
    vector<int16_t> data;
    data.reserve(total);
    for (const auto & frame : frames) {
        data.insert(data.end(), frame.data.begin(), frame.data.end());
    }
    return audio_frame(std::move(data), sample_rate, num_channels, samples_per_channel);
}
