#pragma once

#include "common.h"

void write_audio_file(const audio_frame & data, str path);
