#include "kokoro_chunked_stream.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "audio_byte_stream.h"
#include "util.h"

using json = nlohmann::ordered_json;

static bool is_success(int status) {
    return status >= 200 && status < 300;
}

// httplib reports an expired timeout as a plain connection, read or write failure, so a failure is taken to
// be a timeout when it happened after the phase's bound ran out since the last byte was seen.
[[noreturn]] static void raise_transport_error(httplib::Error err, bool cancelled, bool response_seen,
                                               std::chrono::steady_clock::time_point last_activity,
                                               const api_connect_options & conn_options,
                                               const http_client_options & http_options) {
    const std::string cause = httplib::to_string(err);
    if (cancelled) {
        throw api_connection_error("Synthesis was cancelled (" + cause + ").");
    }
    const std::chrono::duration<double> bound = !response_seen && err == httplib::Error::Connection
        ? conn_options.timeout
        : http_options.request_timeout;
    const std::chrono::duration<double> idle = std::chrono::steady_clock::now() - last_activity;
    if (idle >= bound * 0.95) {
        throw api_timeout_error("Request timed out after " + std::to_string(idle.count()) + "s (" + cause + ").");
    }
    throw api_connection_error("Connection error (" + cause + ").");
}

kokoro_chunked_stream::kokoro_chunked_stream(std::string input_text, const api_connect_options & conn_options,
                                             const synthesis_options & opts, shared_ptr<connection_pool> client):
    chunked_stream(std::move(input_text), conn_options), opts(opts), client(std::move(client)) {
    KOKORO_ASSERT(this->client != nullptr);
}

kokoro_chunked_stream::~kokoro_chunked_stream() {
    stop();
}

std::string kokoro_chunked_stream::request_body() const {
    json body = {
        {"input", input_text()},
        {"model", opts.model},
        {"voice", opts.voice},
        {"response_format", "pcm"},
        {"speed", opts.speed},
    };
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

void kokoro_chunked_stream::on_cancel() {
    std::lock_guard<std::mutex> lock(in_flight_mutex);
    if (in_flight) {
        in_flight->stop();
    }
}

void kokoro_chunked_stream::run(event_channel<synthesized_audio> & event_ch) {
    set_state(SYNTHESIS_REQUESTING);
    const http_client_options & http_options = client->options();
    connection_pool::lease lease = client->acquire(http_options.request_timeout);
    httplib::Client & cli = lease.client();

    // the caller's connect timeout and the per request bound are applied together, each to its own phase.
    const auto [connect_sec, connect_usec] = to_sec_usec(conn_options().timeout);
    const auto [request_sec, request_usec] = to_sec_usec(http_options.request_timeout);
    cli.set_connection_timeout(connect_sec, connect_usec);
    cli.set_read_timeout(request_sec, request_usec);
    cli.set_write_timeout(request_sec, request_usec);

    // Client::stop only interrupts an open socket, a cancel that lands while the connection is being set
    // up waits for the connect to finish or time out. The response handler and the content receiver check
    // for it again once the connection is up.
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex);
        in_flight = &cli;
    }
    if (cancelled()) {
        std::lock_guard<std::mutex> lock(in_flight_mutex);
        in_flight = nullptr;
        throw api_connection_error("Synthesis was cancelled.");
    }

    httplib::Request req;
    req.method = "POST";
    req.path = client->address().path_prefix + "/audio/speech";
    req.set_header("Authorization", "Bearer " + client->api_key());
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "application/octet-stream");
    req.set_header("User-Agent", "kokoro.cpp");
    req.body = request_body();

    std::string request_id;
    std::string error_body;
    int status = 0;
    bool response_seen = false;
    auto last_activity = std::chrono::steady_clock::now();
    audio_byte_stream audio_bstream(KOKORO_SAMPLE_RATE, KOKORO_NUM_CHANNELS);

    bool emitted = false;
    const auto emit = [&](vector<audio_frame> frames, bool last) {
        for (size_t i = 0; i < frames.size(); i++) {
            event_ch.send(synthesized_audio{request_id, std::move(frames[i]), last && i + 1 == frames.size()});
            emitted = true;
        }
    };

    req.response_handler = [&](const httplib::Response & res) {
        response_seen = true;
        last_activity = std::chrono::steady_clock::now();
        status = res.status;
        if (is_success(status)) {
            request_id = short_uuid();
            set_state(SYNTHESIS_STREAMING);
            KOKORO_LOG_INFO("Kokoro -> converting text to audio");
        }
        return !cancelled();
    };

    req.content_receiver = [&](const char * data, size_t length, uint64_t /*offset*/, uint64_t /*total_length*/) {
        last_activity = std::chrono::steady_clock::now();
        if (cancelled()) {
            return false;
        }
        if (!is_success(status)) {
            error_body.append(data, length);
            return true;
        }
        emit(audio_bstream.write(data, length), false);
        return true;
    };

    KOKORO_LOG_DEBUG("POST %s%s voice=%s model=%s speed=%.2f", client->address().origin.c_str(), req.path.c_str(),
                     opts.voice.c_str(), opts.model.c_str(), opts.speed);
    const auto start = std::chrono::steady_clock::now();
    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    const bool sent = cli.send(req, res, err);
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex);
        in_flight = nullptr;
    }

    if (!sent) {
        lease.discard();
        raise_transport_error(err, cancelled(), response_seen, last_activity, conn_options(), http_options);
    }

    if (!is_success(res.status)) {
        throw make_status_error(res.status, res.get_header_value("x-request-id"), error_body);
    }

    set_state(SYNTHESIS_FLUSHING);
    vector<audio_frame> rest = audio_bstream.flush();
    if (rest.empty() && emitted) {
        // the body ended on a frame boundary, so the end of the audio is marked by an empty frame.
        rest.emplace_back(vector<int16_t>{}, KOKORO_SAMPLE_RATE, KOKORO_NUM_CHANNELS, 0);
    }
    emit(std::move(rest), true);
    KOKORO_LOG_INFO("Kokoro TTS synthesis completed in %.1fms", elapsed_ms(start));
}
