#pragma once

#include <mutex>

#include "connection_pool.h"
#include "tts.h"

// One POST /audio/speech call. The options are a snapshot taken by kokoro_tts::synthesize, so updates made
// to the synthesizer afterwards never reach a stream that already exists.
class kokoro_chunked_stream : public chunked_stream {
public:
    kokoro_chunked_stream(std::string input_text, const api_connect_options & conn_options,
                          const synthesis_options & opts, shared_ptr<connection_pool> client);
    ~kokoro_chunked_stream() override;

    const synthesis_options & options() const { return opts; }

    std::string request_body() const;

protected:
    void run(event_channel<synthesized_audio> & event_ch) override;
    void on_cancel() override;

private:
    const synthesis_options opts;
    const shared_ptr<connection_pool> client;

    std::mutex in_flight_mutex;
    httplib::Client * in_flight = nullptr;
};
