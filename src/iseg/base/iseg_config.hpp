/*
 * iseg_config.hpp
 *
 *  Created on: 18 Oct. 2026
 */

#ifndef ISEG_CONFIG_HPP_
#define ISEG_CONFIG_HPP_

/*
 * immutable_segment settings
 * Build toggles:
 *   - ISEG_CHECKED_ACCESS (default: 1)
 *       0 -> operator[] is unchecked (ISEG_ASSERT only); at() still throws
 *       1 -> operator[] validates the index and throws iseg::out_of_range
 *
 *   - ISEG_VERIFY_SIZED_SOURCES (default: 1)
 *       0 -> trust size() of list-like sources and stop after size() elements
 *       1 -> walk list-like sources to their end and throw iseg::inconsistent_sequence
 *            when the walk disagrees with size()
 *
 *   - ISEG_ALLOC_PREFER_ALIGNED_NEW (default: 1)
 *       0 -> over-aligned element types are served by the manual header scheme
 *       1 -> over-aligned element types use ::operator new(size, align_val_t)
 */
#ifndef ISEG_CHECKED_ACCESS
#  define ISEG_CHECKED_ACCESS 1
#endif /* ISEG_CHECKED_ACCESS */

#ifndef ISEG_VERIFY_SIZED_SOURCES
#  define ISEG_VERIFY_SIZED_SOURCES 1
#endif /* ISEG_VERIFY_SIZED_SOURCES */

#ifndef ISEG_ALLOC_PREFER_ALIGNED_NEW
#  define ISEG_ALLOC_PREFER_ALIGNED_NEW 1
#endif /* ISEG_ALLOC_PREFER_ALIGNED_NEW */


// assert ------------------------
#ifndef ISEG_ASSERT
#  define ISEG_ASSERT(x)
#endif /* ISEG_ASSERT */

static_assert(ISEG_CHECKED_ACCESS == 0 || ISEG_CHECKED_ACCESS == 1,
              "ISEG_CHECKED_ACCESS must be 0 or 1");
static_assert(ISEG_VERIFY_SIZED_SOURCES == 0 || ISEG_VERIFY_SIZED_SOURCES == 1,
              "ISEG_VERIFY_SIZED_SOURCES must be 0 or 1");

#endif /* ISEG_CONFIG_HPP_ */
