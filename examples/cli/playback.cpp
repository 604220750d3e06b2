#include "playback.h"

#ifndef PULSE_INSTALL
void register_play_tts_response_args(arg_list & args) {
    // Hide --play
}

unique_ptr<tts_playback> open_tts_playback(const arg_list & args, uint32_t sample_rate, uint32_t num_channels) {
    return nullptr;
}
#else
#include <iostream>
#include <pulse/error.h>
#include <pulse/simple.h>

void register_play_tts_response_args(arg_list & args) {
    args.add({false, "play", "pl", "Whether to play back the audio as it streams in instead of saving it to file"});
}

class pulse_playback : public tts_playback {
    pa_simple * s;
    size_t n_written = 0;

public:
    pulse_playback(uint32_t sample_rate, uint32_t num_channels) {
        const pa_sample_spec ss{
            .format = PA_SAMPLE_S16LE,
            .rate = sample_rate,
            .channels = static_cast<uint8_t>(num_channels),
        };
        int error = 0;
        s = pa_simple_new(
            nullptr, "kokoro.cpp", PA_STREAM_PLAYBACK, nullptr,
            "kokoro.cpp Text to speech", &ss, nullptr, nullptr, &error
        );
        if (!s) {
            std::cerr << "pa_simple_new failed: " << pa_strerror(error) << std::endl;
            exit(1);
        }
    }

    ~pulse_playback() override {
        pa_simple_free(s);
    }

    void write(const audio_frame & frame) override {
        // the end of stream marker carries no samples
        if (frame.data.empty()) {
            return;
        }
        int error = 0;
        if (pa_simple_write(s, frame.data.data(), frame.n_bytes(), &error)) {
            std::cerr << "pa_simple_write failed: " << pa_strerror(error) << std::endl;
            exit(1);
        }
        n_written += frame.samples_per_channel;
    }

    void drain() override {
        std::cout << "Playing audio: " << n_written << " samples" << std::endl;
        int error = 0;
        if (pa_simple_drain(s, &error) < 0) {
            std::cerr << "pa_simple_drain failed: " << pa_strerror(error) << std::endl;
            exit(1);
        }
    }
};

unique_ptr<tts_playback> open_tts_playback(const arg_list & args, uint32_t sample_rate, uint32_t num_channels) {
    if (!args["play"]) {
        return nullptr;
    }
    return make_unique<pulse_playback>(sample_rate, num_channels);
}
#endif
