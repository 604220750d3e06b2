#include <chrono>
#include <cstdio>
#include <thread>

#include "args_common.h"
#include "playback.h"
#include "vad.h"
#include "write_file.h"

class tts_timing_printer {
    const std::chrono::steady_clock::time_point start{std::chrono::steady_clock::now()};
public:
    ~tts_timing_printer() {
        const std::chrono::duration<double, std::milli> total = std::chrono::steady_clock::now() - start;
        printf("total time = %.2f ms\n", total.count());
    }
};

int main(int argc, const char ** argv) {
    const tts_timing_printer _{};
    const std::string usage{usage_with_known_ids("Synthesizes speech with a Kokoro server and writes it to a .wav file or plays it back.")};
    arg_list args{usage.c_str()};
    add_common_args(args);
    args.add({"", "prompt", "p", "The text prompt for which to generate audio", true});
    args.add({"kokoro.cpp.wav", "save-path", "sp", "The path to save the audio output to in a .wav format"});
    args.add({
        false, "vad", "va",
        "Whether to apply voice inactivity detection (VAD) and strip silence from the end of the output. "
        "By default, no VAD is applied"
    });
    register_play_tts_response_args(args);
    args.parse(argc, argv);
    apply_log_level(args);

    const str prompt{args["prompt"]};
    if (!*prompt) {
        fprintf(stderr, "The '--prompt' value must be a non empty string.\n");
        exit(1);
    }

    const api_connect_options conn_options{parse_connect_options(args)};
    const unique_ptr<kokoro_tts> synthesizer{kokoro_from_args(args)};
    unique_ptr<tts_playback> playback{open_tts_playback(args, synthesizer->sample_rate(), synthesizer->num_channels())};

    // retrying is the caller's business, only attempts that produced no audio at all are repeated.
    vector<audio_frame> frames;
    for (int attempt = 0;; attempt++) {
        const unique_ptr<chunked_stream> stream{synthesizer->synthesize(prompt, conn_options)};
        try {
            synthesized_audio event;
            while (stream->next(event)) {
                if (playback) {
                    playback->write(event.frame);
                }
                frames.push_back(std::move(event.frame));
            }
            break;
        } catch (const api_status_error & e) {
            KOKORO_LOG_ERROR("Kokoro server returned HTTP %d: %s (request id '%s')", e.status_code(), e.what(), e.request_id().c_str());
            if (!e.retryable() || !frames.empty() || attempt >= conn_options.max_retry) {
                exit(1);
            }
        } catch (const api_error & e) {
            KOKORO_LOG_ERROR("%s", e.what());
            if (!e.retryable() || !frames.empty() || attempt >= conn_options.max_retry) {
                exit(1);
            }
        }
        KOKORO_LOG_WARN("Retrying synthesis in %.1fs (attempt %d of %d)",
                        conn_options.retry_interval.count(), attempt + 1, conn_options.max_retry);
        std::this_thread::sleep_for(conn_options.retry_interval);
    }

    if (frames.empty()) {
        fprintf(stderr, "Got empty response for prompt, '%s'.\n", prompt);
        exit(1);
    }
    if (playback) {
        playback->drain();
        return 0;
    }
    audio_frame data{combine_audio_frames(frames)};
    if (args["vad"]) {
        apply_energy_voice_inactivity_detection(data);
    }
    write_audio_file(data, args["save-path"]);
    return 0;
}
