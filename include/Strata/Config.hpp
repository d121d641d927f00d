/// @file Config.hpp
/// @brief Compile-time configuration knobs for Strata. Every knob can be overridden with `-D`.
#pragma once

// Diagnostics verbosity: 0 silences the library, 1 reports errors (gate poisoning),
// 2 additionally reports warnings (rejected re-entrant mutations).
#ifndef STRATA_DIAGNOSTICS_LEVEL
#define STRATA_DIAGNOSTICS_LEVEL 2
#endif

// Bucket count a FlatHashMap starts with. Must be a power of two.
#ifndef STRATA_FLAT_MAP_INITIAL_CAPACITY
#define STRATA_FLAT_MAP_INITIAL_CAPACITY 16
#endif

// Index-table slot count an OrderedHashMap starts with. Must be a power of two.
#ifndef STRATA_ORDERED_MAP_INITIAL_SLOTS
#define STRATA_ORDERED_MAP_INITIAL_SLOTS 16
#endif

static_assert(STRATA_DIAGNOSTICS_LEVEL >= 0 && STRATA_DIAGNOSTICS_LEVEL <= 2,
              "STRATA_DIAGNOSTICS_LEVEL must be 0, 1 or 2.");
static_assert(STRATA_FLAT_MAP_INITIAL_CAPACITY > 0 &&
                      (STRATA_FLAT_MAP_INITIAL_CAPACITY & (STRATA_FLAT_MAP_INITIAL_CAPACITY - 1)) == 0,
              "STRATA_FLAT_MAP_INITIAL_CAPACITY must be a power of two.");
static_assert(STRATA_ORDERED_MAP_INITIAL_SLOTS > 0 &&
                      (STRATA_ORDERED_MAP_INITIAL_SLOTS & (STRATA_ORDERED_MAP_INITIAL_SLOTS - 1)) == 0,
              "STRATA_ORDERED_MAP_INITIAL_SLOTS must be a power of two.");
