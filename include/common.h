#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "imports.h"

constexpr uint32_t KOKORO_SAMPLE_RATE = 24000;
constexpr uint32_t KOKORO_NUM_CHANNELS = 1;

const std::vector<std::string> KOKORO_MODELS = {
	"tts-1",
};

const std::vector<std::string> KOKORO_VOICES = {
	"af_heart",
	"af_bella",
};

// Interleaved signed 16-bit PCM. samples_per_channel * num_channels == data.size() always holds.
struct audio_frame {
	audio_frame() = default;
	audio_frame(vector<int16_t> data, uint32_t sample_rate, uint32_t num_channels, uint32_t samples_per_channel);

	vector<int16_t> data;
	uint32_t sample_rate = KOKORO_SAMPLE_RATE;
	uint32_t num_channels = KOKORO_NUM_CHANNELS;
	uint32_t samples_per_channel = 0;

	double duration() const;
	size_t n_bytes() const { return data.size() * sizeof(int16_t); }
};

/// Concatenates frames that share sample rate and channel count into a single frame.
audio_frame combine_audio_frames(const vector<audio_frame> & frames);

struct synthesized_audio {
	std::string request_id;
	audio_frame frame;
	bool is_final = false;
};

struct synthesis_options {
	std::string model = "tts-1";
	std::string voice = "af_heart";
	float speed = 1.0f;
};

// Connection parameters supplied by the caller per synthesis call. The library itself never retries,
// max_retry and retry_interval are carried for the caller's own retry loop.
struct api_connect_options {
	int max_retry = 3;
	std::chrono::duration<double> retry_interval{2.0};
	std::chrono::duration<double> timeout{10.0};
};

inline const api_connect_options DEFAULT_API_CONNECT_OPTIONS{};

struct tts_capabilities {
	bool streaming = false;
};

struct http_client_options {
	std::chrono::duration<double> connect_timeout{15.0};
	std::chrono::duration<double> read_timeout{5.0};
	std::chrono::duration<double> write_timeout{5.0};
	std::chrono::duration<double> pool_timeout{5.0};
	bool follow_redirects = true;
	size_t max_connections = 50;
	size_t max_keepalive_connections = 50;
	std::chrono::duration<double> keepalive_expiry{120.0};
	// upper bound applied to the read, write and pool phases of every synthesis request
	std::chrono::duration<double> request_timeout{30.0};
};
