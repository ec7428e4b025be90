/*
 * Include this file to use assert in test programs. It ensures that NDEBUG is undefined so that a
 * release build can't turn failing checks into passing tests.
 */

#ifndef DEEPEQ_ASSERT_TEST_H
#define DEEPEQ_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* DEEPEQ_ASSERT_TEST_H */
