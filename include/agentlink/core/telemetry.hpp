#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------

#if defined(AGENTLINK_ENABLE_TELEMETRY_L1)
    #define AL_TL1(expr) expr
#else
    #define AL_TL1(expr) ((void)0)
#endif
