#pragma once

// Tracy zones when TOASTKIT_PROFILING_ENABLED is defined (CMake option
// TOASTKIT_ENABLE_PROFILING), empty otherwise.

#ifdef TOASTKIT_PROFILING_ENABLED
#include <tracy/Tracy.hpp>

#define TOASTKIT_ZONE_SCOPED ZoneScoped
#define TOASTKIT_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define TOASTKIT_FRAME_MARK FrameMark

#else
#define TOASTKIT_ZONE_SCOPED
#define TOASTKIT_ZONE_SCOPED_N(name)
#define TOASTKIT_FRAME_MARK
#endif
