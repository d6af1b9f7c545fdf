#pragma once

// Umbrella header: includes the whole audiotally API

#include "audiotally/aggregate.hpp"
#include "audiotally/audio_format.hpp"
#include "audiotally/channel.hpp"
#include "audiotally/config.hpp"
#include "audiotally/duration.hpp"
#include "audiotally/errors.hpp"
#include "audiotally/m4a.hpp"
#include "audiotally/mp3.hpp"
#include "audiotally/pool.hpp"
#include "audiotally/progress.hpp"
#include "audiotally/report.hpp"
#include "audiotally/scan.hpp"
#include "audiotally/tally.hpp"
#include "audiotally/wav.hpp"
