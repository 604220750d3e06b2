#include "kokoro_tts.h"

#include "kokoro_chunked_stream.h"
#include "util.h"

kokoro_tts::kokoro_tts(const std::string & base_url, const std::string & api_key, const std::string & model,
                       const std::string & voice, float speed, shared_ptr<connection_pool> client):
    tts(tts_capabilities{.streaming = false}, KOKORO_SAMPLE_RATE, KOKORO_NUM_CHANNELS),
    opts{.model = model, .voice = voice, .speed = speed},
    _client(client ? std::move(client) : make_shared<connection_pool>(base_url, api_key)) {
    const server_address & address = _client->address();
    KOKORO_LOG_INFO("Using Kokoro TTS API URL: %s%s", address.origin.c_str(), address.path_prefix.c_str());
}

void kokoro_tts::update_options(const synthesis_options_update & update) {
    std::lock_guard<std::mutex> lock(opts_mutex);
    if (update.model) {
        opts.model = *update.model;
    }
    if (update.voice) {
        opts.voice = *update.voice;
    }
    if (update.speed) {
        opts.speed = *update.speed;
    }
}

synthesis_options kokoro_tts::options() const {
    std::lock_guard<std::mutex> lock(opts_mutex);
    return opts;
}

unique_ptr<chunked_stream> kokoro_tts::synthesize(const std::string & text, const api_connect_options & conn_options) {
    return make_unique<kokoro_chunked_stream>(text, conn_options, options(), _client);
}
