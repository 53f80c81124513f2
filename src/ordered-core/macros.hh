#pragma once

// =========================================================================================================
// Platform detection
// =========================================================================================================
//
// compiler:  OC_COMPILER_MSVC | OC_COMPILER_CLANG | OC_COMPILER_GCC, plus OC_COMPILER_POSIX for gcc-like ones
// os:        OC_OS_WINDOWS | OC_OS_APPLE | OC_OS_LINUX | OC_OS_BSD

#if defined(_MSC_VER) && !defined(__clang__)
#define OC_COMPILER_MSVC
#elif defined(__clang__)
#define OC_COMPILER_CLANG
#define OC_COMPILER_POSIX
#elif defined(__GNUC__)
#define OC_COMPILER_GCC
#define OC_COMPILER_POSIX
#else
#error "ordered-core supports MSVC, clang and gcc"
#endif

#if defined(_WIN32)
#define OC_OS_WINDOWS
#elif defined(__APPLE__)
#define OC_OS_APPLE
#elif defined(__linux__)
#define OC_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define OC_OS_BSD
#endif

// =========================================================================================================
// Build configuration
// =========================================================================================================
//
// CMake defines exactly one of OC_DEBUG, OC_RELEASE, OC_RELWITHDEBINFO
// and OC_ENABLE_ASSERT_IN_RELEASE if the option is on.
//
// OC_ASSERT_ENABLED is always 0 or 1 afterwards.
// Only a plain release build turns OC_ASSERT off, so consumers that bypass our CMake keep their checks.

#ifndef OC_ASSERT_ENABLED
#if defined(OC_RELEASE) && !defined(OC_ENABLE_ASSERT_IN_RELEASE)
#define OC_ASSERT_ENABLED 0
#else
#define OC_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

// OC_FORCE_INLINE: for one-line casts like oc::move that should never show up as calls in debug builds
// OC_COLD_FUNC:    growth and failure paths, keeps them out of the hot code layout
#if defined(OC_COMPILER_MSVC)
#define OC_FORCE_INLINE __forceinline
#define OC_COLD_FUNC
#else
// gcc wants the extra 'inline', clang does not care
#define OC_FORCE_INLINE __attribute__((always_inline)) inline
#define OC_COLD_FUNC __attribute__((cold))
#endif

// OC_UNUSED(expr): silences unused warnings without evaluating expr (sizeof is unevaluated)
#define OC_UNUSED(expr) (void)(sizeof((expr)))
