#pragma once

#include "common.h"

float energy(const int16_t * chunk, int count);

// Strips trailing silence from data. Frame energies are min-max normalized over the whole clip and a run of
// at least frame_threshold quiet frames at the end is cut down to a single frame.
void apply_energy_voice_inactivity_detection(
	audio_frame & data,
	int ms_per_frame = 10,
	int frame_threshold = 20,
	float normalized_energy_threshold = 0.01f);
