#pragma once

#include "priv/CommonTypes.hpp"
#include "priv/Logger.hpp"
#include "priv/Errors.hpp"
#include "priv/midi/MidiMessage.hpp"
#include "priv/sequencer/Step.hpp"
#include "priv/sequencer/Sequence.hpp"
#include "priv/sequencer/Metronome.hpp"
#include "priv/engine/SoundEngine.hpp"
#include "priv/sequencer/NoteOffScheduler.hpp"
#include "priv/project/InstrumentRegistry.hpp"
#include "priv/channels/InstrumentChannel.hpp"
#include "priv/channels/StepSequencerChannel.hpp"
#include "priv/channels/FreeMidiChannel.hpp"
#include "priv/channels/FreeMetronomeChannel.hpp"
#include "priv/devices/MidiInputDevice.hpp"
#include "priv/project/Project.hpp"
#include "priv/project/ProjectConfiguration.hpp"
