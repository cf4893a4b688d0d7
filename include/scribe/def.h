#ifndef SCRIBE_DEF_H_INCLUDED
#define SCRIBE_DEF_H_INCLUDED

/**
 * \file
 * \brief Basic definitions shared by the public C headers.
 */

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/*
 * SCRIBE_API marks exported symbols. Scribe is built as a static library by default,
 * define SCRIBE_SHARED when building or using it as a shared library on windows.
 */
#if defined(SCRIBE_SHARED) && (defined(_WIN32) || defined(__CYGWIN__))
#    ifdef SCRIBE_BUILDING_LIBRARY
#        define SCRIBE_API __declspec(dllexport)
#    else
#        define SCRIBE_API __declspec(dllimport)
#    endif
#elif defined(__GNUC__) || defined(__clang__)
#    define SCRIBE_API __attribute__((visibility("default")))
#else
#    define SCRIBE_API
#endif

#endif /* SCRIBE_DEF_H_INCLUDED */
