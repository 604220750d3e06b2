#include <cstdio>
#include <cstdlib>

#include <AudioFile.h>

#include "write_file.h"

void write_audio_file(const audio_frame & data, str path) {
    fprintf(stdout, "Writing audio file: %s\n", path);
    AudioFile<float> file;
    file.setBitDepth(16);
    file.setSampleRate(data.sample_rate);
    file.setNumChannels(data.num_channels);
    file.setNumSamplesPerChannel(data.samples_per_channel);
    // frames are interleaved, AudioFile keeps one buffer per channel.
    for (uint32_t channel = 0; channel < data.num_channels; channel++) {
        for (uint32_t i = 0; i < data.samples_per_channel; i++) {
            file.samples[channel][i] = data.data[i * data.num_channels + channel] / 32768.0f;
        }
    }
    if (!file.save(path, AudioFileFormat::Wave)) {
        fprintf(stderr, "Failed to write audio file: %s\n", path);
        exit(1);
    }
    file.printSummary();
}
