#ifndef __MOCKIO_ASSERT_H__
#define __MOCKIO_ASSERT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <exception>
#include <string>

#include <boost/config.hpp>
#include <boost/current_function.hpp>

#include "exception.h"
#include "log.h"

namespace MockIO {

/// A failed MOCKIO_ASSERT, MOCKIO_VERIFY or MOCKIO_NOTREACHED
///
/// Only thrown when throwOnAssertion is set, as the test runner does so that
/// a test can check for misuse of a stream; otherwise the process terminates.
struct Assertion : virtual Exception
{
    Assertion(const std::string &expr) : m_expr(expr) {}
    ~Assertion() throw() {}

    const char *what() const throw() { return m_expr.c_str(); }

    static bool throwOnAssertion;

private:
    std::string m_expr;
};

BOOST_NORETURN void assertionFailed(const char *expr, const char *function,
    const char *file, int line);

}

#ifdef NDEBUG

#define MOCKIO_ASSERT(x) ((void)0)
#define MOCKIO_VERIFY(x) ((void)(x))
#define MOCKIO_NOTREACHED() ::std::terminate()

#else

#define MOCKIO_ASSERT(x)                                                        \
    ((x) ? (void)0 : ::MockIO::assertionFailed(# x, BOOST_CURRENT_FUNCTION,    \
        __FILE__, __LINE__))
#define MOCKIO_VERIFY(x) MOCKIO_ASSERT(x)
#define MOCKIO_NOTREACHED()                                                     \
    ::MockIO::assertionFailed("not reached", BOOST_CURRENT_FUNCTION,            \
        __FILE__, __LINE__)

#endif

#endif
