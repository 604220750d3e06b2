#ifndef tts_h
#define tts_h

#include <atomic>
#include <string>
#include <thread>

#include "api_error.h"
#include "common.h"
#include "event_channel.h"

enum synthesis_state {
    SYNTHESIS_CREATED    = 0,
    SYNTHESIS_REQUESTING = 1,
    SYNTHESIS_STREAMING  = 2,
    SYNTHESIS_FLUSHING   = 3,
    SYNTHESIS_COMPLETED  = 4,
    SYNTHESIS_ERRORED    = 5,
};

const char * synthesis_state_name(synthesis_state state);

/**
 * One synthesis call for a complete input text. Nothing happens until the stream is first driven through
 * #next or #collect, at which point #run is started on a dedicated thread and its events are delivered
 * through the stream's channel in emission order.
 */
class chunked_stream {
public:
    chunked_stream(std::string input_text, const api_connect_options & conn_options);
    virtual ~chunked_stream();

    chunked_stream(const chunked_stream &) = delete;
    chunked_stream & operator=(const chunked_stream &) = delete;

    // Returns false once the stream completed. Errors raised by #run are rethrown here after every event
    // emitted before the fault has been returned.
    bool next(synthesized_audio & out);

    // Drains the stream and merges every frame into one.
    audio_frame collect();

    // Aborts an in-flight request; the stream ends with an api_connection_error. A request that is still
    // connecting is aborted once the connect completes or hits conn_options().timeout.
    void cancel();

    const std::string & input_text() const { return _input_text; }
    const api_connect_options & conn_options() const { return _conn_options; }
    synthesis_state state() const { return _state.load(); }
    bool cancelled() const { return _cancelled.load(); }

protected:
    virtual void run(event_channel<synthesized_audio> & event_ch) = 0;

    // Called from #cancel, possibly from another thread than the one running #run.
    virtual void on_cancel() {}

    // Logs each transition at debug level.
    void set_state(synthesis_state state);

    // Must be called from the destructor of every derived stream so #run never outlives the members it uses.
    void stop();

private:
    void start();

    const std::string _input_text;
    const api_connect_options _conn_options;
    event_channel<synthesized_audio> event_ch;
    std::atomic<synthesis_state> _state{SYNTHESIS_CREATED};
    std::atomic<bool> _cancelled{false};
    std::once_flag started;
    std::thread worker;
};

/**
 * A text to speech provider: reports its output format and capabilities and produces a chunked_stream
 * per synthesis call.
 */
class tts {
public:
    tts(tts_capabilities capabilities, uint32_t sample_rate, uint32_t num_channels)
        : _capabilities(capabilities), _sample_rate(sample_rate), _num_channels(num_channels) {}
    virtual ~tts() = default;

    virtual unique_ptr<chunked_stream> synthesize(const std::string & text, const api_connect_options & conn_options = DEFAULT_API_CONNECT_OPTIONS) = 0;

    const tts_capabilities & capabilities() const { return _capabilities; }
    uint32_t sample_rate() const { return _sample_rate; }
    uint32_t num_channels() const { return _num_channels; }

private:
    const tts_capabilities _capabilities;
    const uint32_t _sample_rate;
    const uint32_t _num_channels;
};

#endif
