#pragma once

#include "args.h"
#include "common.h"

void register_play_tts_response_args(arg_list & args);

// Plays frames as they are received so playback starts with the first frame rather than after the
// whole response.
struct tts_playback {
    virtual ~tts_playback() = default;
    virtual void write(const audio_frame & frame) = 0;
    virtual void drain() = 0;
};

// nullptr unless '--play' was passed and PulseAudio support is built in.
unique_ptr<tts_playback> open_tts_playback(const arg_list & args, uint32_t sample_rate, uint32_t num_channels);
