#ifndef SCRIBE_ERROR_H_INCLUDED
#define SCRIBE_ERROR_H_INCLUDED

#include "scribe/def.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Defines all possible error codes.
 */
typedef enum scribe_errc_t {
    SCRIBE_OK = 0,
    SCRIBE_ERROR_BAD_CONFIG = 1, /* Invalid dump options or schema configuration */
    SCRIBE_ERROR_BAD_VALUE = 2,  /* Value cannot be represented by the schema */
    SCRIBE_ERROR_BAD_ARG = 3,    /* Invalid argument (e.g. unknown node id) */
    SCRIBE_ERROR_BAD_UTF8 = 4,   /* String is not valid utf8 */
    SCRIBE_ERROR_TOO_DEEP = 5,   /* Nesting limit exceeded */
    SCRIBE_ERROR_INTERNAL = 1000, /* Internal error */
} scribe_errc_t;

/**
 * Returns the name of the given error code.
 * The string points into static storage and must not be freed.
 */
SCRIBE_API const char* scribe_errc_name(scribe_errc_t e);

/**
 * Returns a human readable description of the given error code.
 * The string points into static storage and must not be freed.
 */
SCRIBE_API const char* scribe_errc_message(scribe_errc_t e);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif // SCRIBE_ERROR_H_INCLUDED
