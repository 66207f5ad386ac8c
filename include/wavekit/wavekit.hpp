#pragma once

// Umbrella header — includes the full decode / reduce pipeline

#include "wavekit/audio_io.hpp"
#include "wavekit/config.hpp"
#include "wavekit/pcm.hpp"
#include "wavekit/processor.hpp"
#include "wavekit/reduce.hpp"
#include "wavekit/samples.hpp"
#include "wavekit/timeline.hpp"
#include "wavekit/wav.hpp"
