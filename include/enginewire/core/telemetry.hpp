#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// Counters are compiled in only when ENGINEWIRE_ENABLE_TELEMETRY_L1 is defined.
// Without it EW_TL1(...) expands to nothing and the expression is not evaluated.

#if defined(ENGINEWIRE_ENABLE_TELEMETRY_L1)
    #define EW_TL1(expr) expr
#else
    #define EW_TL1(expr) ((void)0)
#endif
