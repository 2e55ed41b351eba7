#pragma once
#include "config.h"
#include "CureParams.h"
#include "TriStateOutput.h"
#include <events.h>
#include <stdint.h>

#if CYCLE_LOGGING_ENABLED

void cycleLogInit(const CureParams &params);
void cycleLogTransition(uint32_t cycle, CycleState from, CycleState to, DriveMode drive);

#else

// No-op stubs when logging disabled
inline void cycleLogInit(const CureParams &params) {}
inline void cycleLogTransition(uint32_t cycle, CycleState from, CycleState to, DriveMode drive) {}

#endif
