#ifndef AUGUR_CORE_ERRORS_H
#define AUGUR_CORE_ERRORS_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum AugurStatus {
    AUGUR_OK = 0,
    AUGUR_ERR_PARSE = 1,
    AUGUR_ERR_IO = 2,
    AUGUR_ERR_RANGE = 3,
    AUGUR_ERR_TIMEOUT = 4,
    AUGUR_ERR_PROTO = 5,
    AUGUR_ERR_NOMEM = 6,
    AUGUR_ERR_INVALID = 7,
    // Signal codec failures
    AUGUR_ERR_WRONG_LENGTH = 8,
    AUGUR_ERR_DECISION_RANGE = 9,
    AUGUR_ERR_TOO_SHORT = 10,
    AUGUR_ERR_NO_VALID_TUPLE = 11
} AugurStatus;

#ifdef __cplusplus
}
#endif

#endif // AUGUR_CORE_ERRORS_H
