#ifndef AUGUR_CORE_TYPES_H
#define AUGUR_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// --- Constants ---
#define AUGUR_WORD_SIZE 32
#define AUGUR_SIGNAL_FIELDS 3
#define AUGUR_CANONICAL_SIZE (AUGUR_WORD_SIZE * AUGUR_SIGNAL_FIELDS)

// --- Enumerations ---
typedef enum {
    DECISION_SELL = 0,
    DECISION_BUY = 1
} Decision;

// --- Data Structures ---

/**
 * @brief One observation of the historical series.
 * time_index is a day number; price is in the native unit (USD per ETH).
 */
typedef struct {
    uint64_t time_index;
    uint64_t price;
} PricePoint;

#ifdef __cplusplus
static_assert(sizeof(PricePoint) == 16, "PricePoint must be exactly 16 bytes.");
static_assert(AUGUR_CANONICAL_SIZE == 96, "Canonical signal buffer must be 96 bytes.");
#else
_Static_assert(sizeof(PricePoint) == 16, "PricePoint must be exactly 16 bytes.");
_Static_assert(AUGUR_CANONICAL_SIZE == 96, "Canonical signal buffer must be 96 bytes.");
#endif

#ifdef __cplusplus
}
#endif

#endif // AUGUR_CORE_TYPES_H
