#pragma once

#include <stdint.h>

/** @file marlowe/semantics/config.hpp
 *  @brief Defines global constants that determine interpreter behavior
 */
#define MARLOWE_SEMANTICS_VERSION                           1

/**
 *  The native currency is the token whose currency symbol and
 *  token name are both empty.
 */
#define MARLOWE_ADA_CURRENCY_SYMBOL                         ""
#define MARLOWE_ADA_TOKEN_NAME                              ""

/**
 *  Upper bound on internal reduction steps for one call, 0 disables
 *  the bound.  Well formed contracts always terminate, the bound only
 *  protects callers feeding untrusted input.
 */
#define MARLOWE_DEFAULT_MAX_REDUCTION_STEPS                 uint64_t(0)

/**
 *  Used by the applicable-actions query when no later timeout exists
 *  on the current path: one day, in milliseconds.
 */
#define MARLOWE_DEFAULT_INTERVAL_LENGTH_MS                  int64_t(24*60*60*1000)

/**
 *  Deepest value, observation and contract nesting accepted when
 *  decoding JSON.  Evaluation and comparison recurse on nesting depth.
 */
#define MARLOWE_MAX_DECODE_NESTING_DEPTH                    uint32_t(1000)
