#include "vad.h"

#include <cmath>

float energy(const int16_t * chunk, int count) {
	float en = 0.0f;
	for (int i = 0; i < count; i++) {
		const float sample = chunk[i] / 32768.0f;
		en += sample * sample;
	}
	return en;
}

void apply_energy_voice_inactivity_detection(
	audio_frame & data,
	int ms_per_frame,
	int frame_threshold,
	float normalized_energy_threshold) {
	const int samples_per_frame = (int) (ms_per_frame * data.sample_rate / 1000.0f) * (int) data.num_channels;
	if (samples_per_frame <= 0) {
		return;
	}
	const int n_frames = (int) (data.data.size() / samples_per_frame);
	if (n_frames == 0) {
		return;
	}

	// for min-max normalization
	float max_energy = 0.0f;
	float min_energy = 0.0f;
	vector<float> energies(n_frames);

	// compute the energies and the necessary elements for min-max normalization
	for (int i = 0; i < n_frames; i++) {
		energies[i] = energy(data.data.data() + i * samples_per_frame, samples_per_frame);
		if (i == 0) {
			max_energy = energies[i];
			min_energy = energies[i];
		} else if (energies[i] > max_energy) {
			max_energy = energies[i];
		} else if (energies[i] < min_energy) {
			min_energy = energies[i];
		}
	}
	if (max_energy <= min_energy) {
		// a flat clip has nothing to tell apart
		return;
	}

	int concurrent_silent_frames = 0;
	for (int i = 0; i < n_frames; i++) {
		const float frame_energy = (energies[i] - min_energy) / (max_energy - min_energy);
		if (frame_energy < normalized_energy_threshold) {
			concurrent_silent_frames++;
		} else {
			concurrent_silent_frames = 0;
		}
	}
	if (concurrent_silent_frames >= frame_threshold) {
		// samples past the last whole vad frame belong to the silent tail as well
		const size_t keep = (size_t) (n_frames - concurrent_silent_frames + 1) * samples_per_frame;
		data.data.resize(keep);
		data.samples_per_channel = (uint32_t) (keep / data.num_channels);
	}
}
