#include <atomic>
#include <thread>

#include <nlohmann/json.hpp>

#include "kokoro_tts.h"
#include "../../src/kokoro_chunked_stream.h"
#include "../fake_speech_server.h"
#include "../test_utils.h"

using json = nlohmann::ordered_json;

struct drained_stream {
    vector<synthesized_audio> events;
    std::exception_ptr error = nullptr;
};

static drained_stream drain(chunked_stream & stream) {
    drained_stream result;
    try {
        synthesized_audio event;
        while (stream.next(event)) {
            result.events.push_back(std::move(event));
        }
    } catch (...) {
        result.error = std::current_exception();
    }
    return result;
}

static size_t total_bytes(const drained_stream & result) {
    size_t n = 0;
    for (const auto & event : result.events) {
        n += event.frame.n_bytes();
    }
    return n;
}

static shared_ptr<connection_pool> pool_for(const std::string & base_url, std::chrono::duration<double> request_timeout = std::chrono::seconds(5)) {
    http_client_options options{};
    options.request_timeout = request_timeout;
    return make_shared<connection_pool>(base_url, "sk-test", options);
}

int main() {
    kokoro_set_log_level(KOKORO_LOG_LEVEL_WARN);
    fake_speech_server server;

    run_case("synthesizer reports fixed output format and no streaming input", [&] {
        kokoro_tts synthesizer(server.base_url());
        EXPECT_EQ(synthesizer.sample_rate(), 24000u);
        EXPECT_EQ(synthesizer.num_channels(), 1u);
        EXPECT(!synthesizer.capabilities().streaming);
        const synthesis_options options = synthesizer.options();
        EXPECT_EQ(options.model, "tts-1");
        EXPECT_EQ(options.voice, "af_heart");
        EXPECT_NEAR(options.speed, 1.0, 1e-9);
        EXPECT_EQ(synthesizer.client()->address().path_prefix, "/v1");
    });

    run_case("update_options only changes the given fields", [&] {
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        synthesizer.update_options({.voice = "af_bella"});
        synthesis_options options = synthesizer.options();
        EXPECT_EQ(options.model, "tts-1");
        EXPECT_EQ(options.voice, "af_bella");
        EXPECT_NEAR(options.speed, 1.0, 1e-9);

        synthesizer.update_options({.speed = 1.5f});
        options = synthesizer.options();
        EXPECT_EQ(options.model, "tts-1");
        EXPECT_EQ(options.voice, "af_bella");
        EXPECT_NEAR(options.speed, 1.5, 1e-9);

        synthesizer.update_options({.model = ""});
        options = synthesizer.options();
        EXPECT_EQ(options.model, "");
        EXPECT_EQ(options.voice, "af_bella");
        EXPECT_NEAR(options.speed, 1.5, 1e-9);

        synthesizer.update_options({});
        EXPECT_EQ(synthesizer.options().voice, "af_bella");
    });

    run_case("synthesize does not touch the network until driven", [&] {
        server.set_behaviour({});
        const size_t before = server.requests().size();
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        {
            unique_ptr<chunked_stream> stream = synthesizer.synthesize("never sent");
            EXPECT_EQ(stream->state(), SYNTHESIS_CREATED);
            EXPECT_EQ(stream->input_text(), "never sent");
        }
        EXPECT_EQ(server.requests().size(), before);
    });

    run_case("request carries credentials and the pcm speech body", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 10)}});
        const size_t before = server.requests().size();
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_bella", 1.25f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("Hello from kokoro");
        const drained_stream result = drain(*stream);
        EXPECT(result.error == nullptr);

        const vector<recorded_request> requests = server.requests();
        EXPECT_EQ(requests.size(), before + 1);
        const recorded_request & req = requests.back();
        EXPECT_EQ(req.path, "/v1/audio/speech");
        EXPECT_EQ(req.authorization, "Bearer sk-test");
        EXPECT_EQ(req.content_type, "application/json");
        const json body = json::parse(req.body);
        EXPECT_EQ(body.at("input").get<std::string>(), "Hello from kokoro");
        EXPECT_EQ(body.at("model").get<std::string>(), "tts-1");
        EXPECT_EQ(body.at("voice").get<std::string>(), "af_bella");
        EXPECT_EQ(body.at("response_format").get<std::string>(), "pcm");
        EXPECT_NEAR(body.at("speed").get<double>(), 1.25, 1e-6);
    });

    run_case("stream keeps the options it was created with", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 4)}});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> early = synthesizer.synthesize("first");
        synthesizer.update_options({.voice = "af_bella", .speed = 2.0f});
        unique_ptr<chunked_stream> late = synthesizer.synthesize("second");

        EXPECT(drain(*early).error == nullptr);
        json body = json::parse(server.requests().back().body);
        EXPECT_EQ(body.at("voice").get<std::string>(), "af_heart");
        EXPECT_NEAR(body.at("speed").get<double>(), 1.0, 1e-6);

        EXPECT(drain(*late).error == nullptr);
        body = json::parse(server.requests().back().body);
        EXPECT_EQ(body.at("voice").get<std::string>(), "af_bella");
        EXPECT_NEAR(body.at("speed").get<double>(), 2.0, 1e-6);
    });

    run_case("chunks of 5, 7 and 2 bytes arrive as 14 bytes of whole samples", [&] {
        const vector<uint8_t> bytes = pcm_bytes(100, 7);
        server.set_behaviour({
            .chunks = {
                vector<uint8_t>(bytes.begin(), bytes.begin() + 5),
                vector<uint8_t>(bytes.begin() + 5, bytes.begin() + 12),
                vector<uint8_t>(bytes.begin() + 12, bytes.end()),
            },
            .chunk_delay = std::chrono::milliseconds(20),
        });
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("short");
        const drained_stream result = drain(*stream);
        EXPECT(result.error == nullptr);
        EXPECT_EQ(total_bytes(result), 14u);
        vector<int16_t> samples;
        for (const auto & event : result.events) {
            EXPECT_EQ(event.frame.n_bytes() % 2, 0u);
            samples.insert(samples.end(), event.frame.data.begin(), event.frame.data.end());
        }
        EXPECT((samples == vector<int16_t>{100, 101, 102, 103, 104, 105, 106}));
        EXPECT_EQ(stream->state(), SYNTHESIS_COMPLETED);
    });

    run_case("long responses are framed in 100ms frames tagged with one request id", [&] {
        // 2.5 frames of audio in uneven chunks
        const vector<uint8_t> bytes = pcm_bytes(-3000, 6000);
        vector<vector<uint8_t>> chunks;
        for (size_t offset = 0; offset < bytes.size(); offset += 1001) {
            chunks.emplace_back(bytes.begin() + offset, bytes.begin() + std::min(bytes.size(), offset + 1001));
        }
        server.set_behaviour({.chunks = chunks});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("longer");
        const drained_stream result = drain(*stream);
        EXPECT(result.error == nullptr);
        EXPECT_EQ(result.events.size(), 3u);
        if (result.events.size() == 3) {
            EXPECT_EQ(result.events[0].frame.samples_per_channel, 2400u);
            EXPECT_EQ(result.events[1].frame.samples_per_channel, 2400u);
            EXPECT_EQ(result.events[2].frame.samples_per_channel, 1200u);
            EXPECT(!result.events[0].is_final);
            EXPECT(!result.events[1].is_final);
            EXPECT(result.events[2].is_final);
            EXPECT(!result.events[0].request_id.empty());
            EXPECT_EQ(result.events[0].request_id, result.events[1].request_id);
            EXPECT_EQ(result.events[0].request_id, result.events[2].request_id);
            EXPECT_EQ(result.events[0].frame.data[0], -3000);
            EXPECT_EQ(result.events[2].frame.data.back(), -3000 + 5999);
        }
    });

    run_case("every synthesis call gets a fresh request id", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 8)}});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        const drained_stream a = drain(*synthesizer.synthesize("one"));
        const drained_stream b = drain(*synthesizer.synthesize("two"));
        EXPECT_EQ(a.events.size(), 1u);
        EXPECT_EQ(b.events.size(), 1u);
        if (!a.events.empty() && !b.events.empty()) {
            EXPECT(a.events[0].request_id != b.events[0].request_id);
        }
    });

    run_case("empty body completes without frames", [&] {
        server.set_behaviour({});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("silence");
        const audio_frame audio = stream->collect();
        EXPECT_EQ(audio.samples_per_channel, 0u);
        EXPECT_EQ(stream->state(), SYNTHESIS_COMPLETED);
    });

    run_case("status 500 raises a status error with the server message", [&] {
        server.set_behaviour({
            .status = 500,
            .error_body = R"({"message":"server overloaded"})",
            .request_id = "req_abc123",
        });
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("overloaded");
        const drained_stream result = drain(*stream);
        EXPECT(result.events.empty());
        bool raised = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_status_error & e) {
            raised = true;
            EXPECT_EQ(e.status_code(), 500);
            EXPECT_EQ(std::string(e.what()), "server overloaded");
            EXPECT_EQ(e.request_id(), "req_abc123");
            EXPECT_EQ(e.body(), R"({"message":"server overloaded"})");
            EXPECT(e.retryable());
        } catch (const std::exception &) {
        }
        EXPECT(raised);
        EXPECT_EQ(stream->state(), SYNTHESIS_ERRORED);
    });

    run_case("client errors are not retryable and keep an OpenAI style message", [&] {
        server.set_behaviour({
            .status = 400,
            .error_body = R"({"error":{"message":"Voice 'nobody' not found","type":"invalid_request_error"}})",
        });
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "nobody", 1.0f, pool_for(server.base_url()));
        const drained_stream result = drain(*synthesizer.synthesize("who"));
        EXPECT(result.events.empty());
        bool raised = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_status_error & e) {
            raised = true;
            EXPECT_EQ(e.status_code(), 400);
            EXPECT_EQ(std::string(e.what()), "Voice 'nobody' not found");
            EXPECT(!e.retryable());
        } catch (const std::exception &) {
        }
        EXPECT(raised);
    });

    run_case("stalled response headers raise a timeout without frames", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 4800)}, .stall = std::chrono::milliseconds(1500)});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f,
                               pool_for(server.base_url(), std::chrono::milliseconds(300)));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("slow");
        const drained_stream result = drain(*stream);
        EXPECT(result.events.empty());
        bool timed_out = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_timeout_error &) {
            timed_out = true;
        } catch (const std::exception &) {
        }
        EXPECT(timed_out);
        EXPECT_EQ(stream->state(), SYNTHESIS_ERRORED);
    });

    run_case("refused connections raise a connection error", [&] {
        // nothing listens on the discard port of the loopback interface
        kokoro_tts synthesizer("http://127.0.0.1:9", "sk-test", "tts-1", "af_heart", 1.0f, pool_for("http://127.0.0.1:9"));
        const drained_stream result = drain(*synthesizer.synthesize("nobody home"));
        EXPECT(result.events.empty());
        bool connection_error = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_timeout_error &) {
        } catch (const api_connection_error &) {
            connection_error = true;
        } catch (const std::exception &) {
        }
        EXPECT(connection_error);
    });

    run_case("frames received before a broken body are kept", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 2400), pcm_bytes(2400, 2400), pcm_bytes(0, 100)}, .fail_after_chunks = true});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("cut off");
        const drained_stream result = drain(*stream);
        EXPECT_EQ(result.events.size(), 2u);
        for (const auto & event : result.events) {
            EXPECT_EQ(event.frame.samples_per_channel, 2400u);
            EXPECT(!event.is_final);
        }
        bool connection_error = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_connection_error &) {
            connection_error = true;
        } catch (const std::exception &) {
        }
        EXPECT(connection_error);
        EXPECT_EQ(stream->state(), SYNTHESIS_ERRORED);
    });

    run_case("redirects are followed", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(7, 3)}});
        const std::string moved = server.origin() + "/moved";
        kokoro_tts synthesizer(moved, "sk-test", "tts-1", "af_heart", 1.0f, pool_for(moved));
        const drained_stream result = drain(*synthesizer.synthesize("moved"));
        EXPECT(result.error == nullptr);
        EXPECT_EQ(result.events.size(), 1u);
        if (!result.events.empty()) {
            EXPECT((result.events[0].frame.data == vector<int16_t>{7, 8, 9}));
        }
    });

    run_case("cancel aborts an in-flight request", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 100), pcm_bytes(0, 100)}, .chunk_delay = std::chrono::milliseconds(1000)});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("cancel me");
        const auto start = std::chrono::steady_clock::now();
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            stream->cancel();
        });
        const drained_stream result = drain(*stream);
        canceller.join();
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
        EXPECT(stream->cancelled());
        EXPECT(elapsed.count() < 1.0);
        bool connection_error = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_timeout_error &) {
        } catch (const api_connection_error &) {
            connection_error = true;
        } catch (const std::exception &) {
        }
        EXPECT(connection_error);
    });

    run_case("concurrent streams share the pool but not their audio", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(1, 3000)}, .chunk_delay = std::chrono::milliseconds(50)});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        std::atomic<int> ok{0};
        vector<std::thread> threads;
        for (int i = 0; i < 4; i++) {
            threads.emplace_back([&] {
                const audio_frame audio = synthesizer.synthesize("parallel")->collect();
                if (audio.samples_per_channel == 3000 && audio.data.front() == 1 && audio.data.back() == 3000) {
                    ok++;
                }
            });
        }
        for (auto & thread : threads) {
            thread.join();
        }
        EXPECT_EQ(ok.load(), 4);
        EXPECT_EQ(synthesizer.client()->active_connections(), 0u);
        EXPECT(synthesizer.client()->idle_connections() >= 1u);
    });

    run_case("complete frames are delivered while the body is still streaming", [&] {
        server.set_behaviour({
            .chunks = {pcm_bytes(0, 2400), pcm_bytes(2400, 100)},
            .pause_after_first_chunk = std::chrono::milliseconds(1000),
        });
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("paused");
        const auto start = std::chrono::steady_clock::now();
        synthesized_audio event;
        EXPECT(stream->next(event));
        const std::chrono::duration<double> first_frame = std::chrono::steady_clock::now() - start;
        EXPECT(first_frame.count() < 0.6);
        EXPECT_EQ(event.frame.samples_per_channel, 2400u);
        EXPECT(!event.is_final);
        EXPECT_EQ(stream->state(), SYNTHESIS_STREAMING);

        EXPECT(stream->next(event));
        EXPECT_EQ(event.frame.samples_per_channel, 100u);
        EXPECT_EQ(event.frame.data.front(), 2400);
        EXPECT(event.is_final);
        EXPECT(!stream->next(event));
    });

    run_case("a body ending on a frame boundary ends with an empty final frame", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 2400)}});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        const drained_stream result = drain(*synthesizer.synthesize("exact"));
        EXPECT(result.error == nullptr);
        EXPECT_EQ(result.events.size(), 2u);
        if (result.events.size() == 2) {
            EXPECT_EQ(result.events[0].frame.samples_per_channel, 2400u);
            EXPECT(!result.events[0].is_final);
            EXPECT_EQ(result.events[1].frame.samples_per_channel, 0u);
            EXPECT(result.events[1].frame.data.empty());
            EXPECT(result.events[1].is_final);
            EXPECT_EQ(result.events[1].request_id, result.events[0].request_id);
        }
    });

    run_case("a stream cancelled before it is driven never sends its request", [&] {
        server.set_behaviour({.chunks = {pcm_bytes(0, 100)}});
        const size_t before = server.requests().size();
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        unique_ptr<chunked_stream> stream = synthesizer.synthesize("too late");
        stream->cancel();
        const drained_stream result = drain(*stream);
        EXPECT(result.events.empty());
        bool connection_error = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_connection_error &) {
            connection_error = true;
        } catch (const std::exception &) {
        }
        EXPECT(connection_error);
        EXPECT_EQ(stream->state(), SYNTHESIS_ERRORED);
        EXPECT_EQ(server.requests().size(), before);
    });

    run_case("large error bodies are kept whole", [&] {
        const std::string body = json{{"message", "payload too large"}, {"padding", std::string(100 * 1024, 'x')}}.dump();
        server.set_behaviour({.status = 413, .error_body = body});
        kokoro_tts synthesizer(server.base_url(), "sk-test", "tts-1", "af_heart", 1.0f, pool_for(server.base_url()));
        const drained_stream result = drain(*synthesizer.synthesize("big"));
        bool raised = false;
        try {
            if (result.error) {
                std::rethrow_exception(result.error);
            }
        } catch (const api_status_error & e) {
            raised = true;
            EXPECT_EQ(e.status_code(), 413);
            EXPECT_EQ(e.body().size(), body.size());
            EXPECT(e.body() == body);
            EXPECT_EQ(std::string(e.what()), "payload too large");
            EXPECT(!e.retryable());
        } catch (const std::exception &) {
        }
        EXPECT(raised);
    });

    run_case("state names", [] {
        EXPECT_EQ(std::string(synthesis_state_name(SYNTHESIS_CREATED)), "created");
        EXPECT_EQ(std::string(synthesis_state_name(SYNTHESIS_STREAMING)), "streaming");
        EXPECT_EQ(std::string(synthesis_state_name(SYNTHESIS_ERRORED)), "errored");
    });

    run_case("request body is built from the snapshot", [&] {
        kokoro_chunked_stream stream("Hi", DEFAULT_API_CONNECT_OPTIONS, synthesis_options{.model = "tts-1", .voice = "af_heart", .speed = 0.5f},
                                     pool_for(server.base_url()));
        const json body = json::parse(stream.request_body());
        EXPECT_EQ(body.dump(), R"({"input":"Hi","model":"tts-1","voice":"af_heart","response_format":"pcm","speed":0.5})");
    });

    return report("kokoro_tts");
}
