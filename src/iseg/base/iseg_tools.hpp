/*
 * iseg_tools.hpp
 *
 *  Created on: 18 Oct. 2026
 *
 * Portability helpers shared by every iseg header.
 * - Inlining and branch-prediction hints.
 * - Exceptions sanity check: iseg reports every contract violation by throwing,
 *   so a build with exceptions disabled is rejected at compile time.
 * - C++20 <span> detection.
 */

#ifndef ISEG_TOOLS_HPP_
#define ISEG_TOOLS_HPP_

#include "iseg_config.hpp"

/* ---------------------------------------------------------------------------
 * ISEG_FORCEINLINE: strong inlining hint for hot accessors.
 * ------------------------------------------------------------------------- */
#ifndef ISEG_FORCEINLINE
#  if defined(_MSC_VER)
#    define ISEG_FORCEINLINE __forceinline
#  elif defined(__clang__) || defined(__GNUC__)
#    define ISEG_FORCEINLINE inline __attribute__((always_inline))
#  else
#    define ISEG_FORCEINLINE inline
#  endif
#endif /* ISEG_FORCEINLINE */

/* ---------------------------------------------------------------------------
 * ISEG_NOINLINE: keeps cold throw paths out of the hot accessors.
 * ------------------------------------------------------------------------- */
#ifndef ISEG_NOINLINE
#  if defined(_MSC_VER)
#    define ISEG_NOINLINE __declspec(noinline)
#  elif defined(__clang__) || defined(__GNUC__)
#    define ISEG_NOINLINE __attribute__((noinline))
#  else
#    define ISEG_NOINLINE
#  endif
#endif /* ISEG_NOINLINE */

#ifndef ISEG_LIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define ISEG_LIKELY(x)   __builtin_expect(!!(x), 1)
#  else
#    define ISEG_LIKELY(x)   (x)
#  endif
#endif /* ISEG_LIKELY */

#ifndef ISEG_UNLIKELY
#  if defined(__clang__) || defined(__GNUC__)
#    define ISEG_UNLIKELY(x) __builtin_expect(!!(x), 0)
#  else
#    define ISEG_UNLIKELY(x) (x)
#  endif
#endif /* ISEG_UNLIKELY */

// ============================================================================
// Exceptions
// ============================================================================
#if !defined(__cpp_exceptions) && !defined(__EXCEPTIONS) && \
        !(defined(_MSC_VER) && defined(_CPPUNWIND))
#  error "iseg reports range and sequence violations by throwing; enable exceptions"
#endif

// ============================================================================
// C++20 SPAN
// ============================================================================
#if defined(__has_include)
#  if __has_include(<span>) && (__cplusplus >= 202002L)
#    include <span>
#    define ISEG_HAS_SPAN 1
#  else
#    define ISEG_HAS_SPAN 0
#  endif
#else
#  define ISEG_HAS_SPAN 0
#endif /* ISEG_HAS_SPAN */

#endif /* ISEG_TOOLS_HPP_ */
