#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "connection_pool.h"
#include "tts.h"

// Fields left empty keep their current value; an empty string is a value like any other.
struct synthesis_options_update {
    std::optional<std::string> model;
    std::optional<std::string> voice;
    std::optional<float> speed;
};

/**
 * Text to speech through a Kokoro server's OpenAI compatible /audio/speech endpoint. Audio is requested as
 * raw 24kHz mono 16-bit PCM and re-framed into 100ms frames as it streams in. The full input text must be
 * known before synthesis starts.
 */
class kokoro_tts : public tts {
public:
    explicit kokoro_tts(
        const std::string & base_url = "http://localhost:8000",
        const std::string & api_key = "sk-kokoro",
        const std::string & model = "tts-1",
        const std::string & voice = "af_heart",
        float speed = 1.0f,
        shared_ptr<connection_pool> client = nullptr);

    void update_options(const synthesis_options_update & update);

    synthesis_options options() const;

    unique_ptr<chunked_stream> synthesize(const std::string & text, const api_connect_options & conn_options = DEFAULT_API_CONNECT_OPTIONS) override;

    const shared_ptr<connection_pool> & client() const { return _client; }

private:
    mutable std::mutex opts_mutex;
    synthesis_options opts;
    shared_ptr<connection_pool> _client;
};
