#pragma once

#if defined(_MSC_VER) && !defined(__clang__)
#define STRATA_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
#define STRATA_ALWAYS_INLINE inline __attribute__((always_inline))
#else
#define STRATA_ALWAYS_INLINE inline
#endif

#ifndef STRATA_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(STRATA_SHARED_BUILD)
#define STRATA_API __declspec(dllexport)
#elif defined(STRATA_SHARED)
#define STRATA_API __declspec(dllimport)
#else
#define STRATA_API
#endif
#define STRATA_LOCAL
#else
#if defined(STRATA_SHARED_BUILD) || defined(STRATA_SHARED)
#define STRATA_API __attribute__((visibility("default")))
#else
#define STRATA_API
#endif
#define STRATA_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef STRATA_LOCAL
#define STRATA_LOCAL
#endif
