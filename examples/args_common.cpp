#include "args_common.h"

#include <cstdio>
#include <cstdlib>
#include <string>

static const synthesis_options default_options{};
static const http_client_options default_http_options{};

void add_connection_args(arg_list & args) {
    args.add({
        "http://localhost:8000", "base-url", "u",
        "The base URL of the OpenAI compatible Kokoro server. The speech endpoint is '<base-url>/audio/speech', "
        "so pass 'http://host:port/v1' for servers that mount the API under '/v1'"
    });
    args.add({"sk-kokoro", "api-key", "k", "The API key sent to the server as a bearer token"});
    args.add({
        static_cast<float>(DEFAULT_API_CONNECT_OPTIONS.timeout.count()), "timeout", "t",
        "The timeout in seconds for establishing the connection to the server"
    });
    args.add({
        static_cast<float>(default_http_options.request_timeout.count()), "request-timeout", "rt",
        "The timeout in seconds for each read, write or wait for a free connection during a synthesis request"
    });
    args.add({
        DEFAULT_API_CONNECT_OPTIONS.max_retry, "max-retry", "mr",
        "How many times a failed request is retried when the error is retryable and no audio was received yet"
    });
    args.add({
        static_cast<float>(DEFAULT_API_CONNECT_OPTIONS.retry_interval.count()), "retry-interval", "ri",
        "The number of seconds to wait between retries"
    });
}

void add_synthesis_args(arg_list & args) {
    args.add({default_options.model.c_str(), "model", "m", "The TTS model id to request"});
    args.add({
        default_options.voice.c_str(), "voice", "v",
        "The voice id to synthesize with, e.g. 'af_heart' or 'af_bella'. "
        "Kokoro also accepts weighted voice combinations such as 'af_bella+af_heart'"
    });
    args.add({
        default_options.speed, "speed", "s",
        "The speech speed multiplier. Must be between 0.25 and 4.0"
    });
}

void add_log_level_arg(arg_list & args) {
    args.add({"info", "log-level", "ll", "The minimum level of log messages to print: debug, info, warn, error or none"});
}

void add_common_args(arg_list & args) {
    add_connection_args(args);
    add_synthesis_args(args);
    add_log_level_arg(args);
}

static std::string join(const vector<std::string> & values) {
    std::string joined;
    for (const auto & value : values) {
        joined += (joined.empty() ? "" : ", ") + value;
    }
    return joined;
}

std::string usage_with_known_ids(const std::string & description) {
    return description + "\n\nKnown models: " + join(KOKORO_MODELS) + "\nKnown voices: " + join(KOKORO_VOICES);
}

void apply_log_level(const arg_list & args) {
    const sv level{static_cast<str>(args["log-level"])};
    if (level == "debug") {
        kokoro_set_log_level(KOKORO_LOG_LEVEL_DEBUG);
    } else if (level == "info") {
        kokoro_set_log_level(KOKORO_LOG_LEVEL_INFO);
    } else if (level == "warn") {
        kokoro_set_log_level(KOKORO_LOG_LEVEL_WARN);
    } else if (level == "error") {
        kokoro_set_log_level(KOKORO_LOG_LEVEL_ERROR);
    } else if (level == "none") {
        kokoro_set_log_level(KOKORO_LOG_LEVEL_NONE);
    } else {
        fprintf(stderr, "The '--log-level' value must be one of debug, info, warn, error or none. It was set to '%s'.\n", level.data());
        exit(1);
    }
}

http_client_options parse_http_client_options(const arg_list & args) {
    http_client_options options{};
    const float request_timeout{args["request-timeout"]};
    if (request_timeout <= 0.0f) {
        fprintf(stderr, "The '--request-timeout' value must be greater than 0. It was set to '%.3f'.\n", request_timeout);
        exit(1);
    }
    options.request_timeout = std::chrono::duration<double>(request_timeout);
    return options;
}

api_connect_options parse_connect_options(const arg_list & args) {
    const float timeout{args["timeout"]};
    const float retry_interval{args["retry-interval"]};
    const int max_retry{args["max-retry"]};
    if (timeout <= 0.0f) {
        fprintf(stderr, "The '--timeout' value must be greater than 0. It was set to '%.3f'.\n", timeout);
        exit(1);
    }
    if (max_retry < 0 || retry_interval < 0.0f) {
        fprintf(stderr, "The '--max-retry' and '--retry-interval' values must not be negative.\n");
        exit(1);
    }
    return api_connect_options{
        .max_retry = max_retry,
        .retry_interval = std::chrono::duration<double>(retry_interval),
        .timeout = std::chrono::duration<double>(timeout),
    };
}

synthesis_options parse_synthesis_options(const arg_list & args) {
    const synthesis_options options{
        .model{static_cast<str>(args["model"])},
        .voice{static_cast<str>(args["voice"])},
        .speed{args["speed"]},
    };
    if (options.speed < 0.25f || options.speed > 4.0f) {
        fprintf(stderr, "The '--speed' value must be between 0.25 and 4.0. It was set to '%.6f'.\n", options.speed);
        exit(1);
    }
    return options;
}

unique_ptr<kokoro_tts> kokoro_from_args(const arg_list & args) {
    const str base_url{args["base-url"]};
    const str api_key{args["api-key"]};
    const synthesis_options options{parse_synthesis_options(args)};
    auto pool = make_shared<connection_pool>(base_url, api_key, parse_http_client_options(args));
    return make_unique<kokoro_tts>(base_url, api_key, options.model, options.voice, options.speed, pool);
}
