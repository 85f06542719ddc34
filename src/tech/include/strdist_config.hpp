#pragma once

#if defined(__clang__) && defined(__clang_minor__)
#define STRDIST_CLANG (__clang_major__ * 10000 + __clang_minor__ * 100 + __clang_patchlevel__)
#elif defined(__GNUC__) && defined(__GNUC_MINOR__) && defined(__GNUC_PATCHLEVEL__)
#define STRDIST_GCC (__GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__)
#elif defined(_MSC_FULL_VER)
#define STRDIST_MSVC _MSC_FULL_VER
#endif

#if defined(__GNUC__)
#define STRDIST_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define STRDIST_UNLIKELY(x) (!!(x))
#endif

#ifdef STRDIST_MSVC
#define STRDIST_ALWAYS_INLINE __forceinline
#elif defined(__GNUC__)
#define STRDIST_ALWAYS_INLINE inline __attribute__((__always_inline__))
#else
#define STRDIST_ALWAYS_INLINE inline
#endif
