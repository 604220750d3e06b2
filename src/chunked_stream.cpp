#include "tts.h"

#include "util.h"

const char * synthesis_state_name(synthesis_state state) {
    switch (state) {
        case SYNTHESIS_CREATED:
            return "created";
        case SYNTHESIS_REQUESTING:
            return "requesting";
        case SYNTHESIS_STREAMING:
            return "streaming";
        case SYNTHESIS_FLUSHING:
            return "flushing";
        case SYNTHESIS_COMPLETED:
            return "completed";
        case SYNTHESIS_ERRORED:
            return "errored";
        default:
            return "unknown";
    }
}

chunked_stream::chunked_stream(std::string input_text, const api_connect_options & conn_options):
    _input_text(std::move(input_text)), _conn_options(conn_options) {}

chunked_stream::~chunked_stream() {
    stop();
}

void chunked_stream::start() {
    std::call_once(started, [this] {
        worker = std::thread([this] {
            try {
                if (cancelled()) {
                    throw api_connection_error("Synthesis was cancelled.");
                }
                run(event_ch);
                set_state(SYNTHESIS_COMPLETED);
                event_ch.close();
            } catch (...) {
                // the error is handed to the consumer, who rethrows it from #next.
                set_state(SYNTHESIS_ERRORED);
                event_ch.close_with_error(std::current_exception());
            }
        });
    });
}

void chunked_stream::set_state(synthesis_state state) {
    const synthesis_state previous = _state.exchange(state);
    KOKORO_LOG_DEBUG("synthesis stream %s -> %s", synthesis_state_name(previous), synthesis_state_name(state));
}

bool chunked_stream::next(synthesized_audio & out) {
    start();
    return event_ch.recv(out);
}

audio_frame chunked_stream::collect() {
    vector<audio_frame> frames;
    synthesized_audio event;
    while (next(event)) {
        frames.push_back(std::move(event.frame));
    }
    return combine_audio_frames(frames);
}

void chunked_stream::cancel() {
    if (!_cancelled.exchange(true)) {
        on_cancel();
    }
}

void chunked_stream::stop() {
    cancel();
    if (worker.joinable()) {
        worker.join();
    }
}
