// Copyright (c) 2010 - Mozy, Inc.

#include "assert.h"

namespace MockIO {

bool Assertion::throwOnAssertion;

void assertionFailed(const char *expr, const char *function,
    const char *file, int line)
{
    std::vector<void *> stack = backtrace(1);
    Log::root()->log(Log::FATAL, std::string("ASSERTION: ") + expr +
        " in " + function + "\nbacktrace:\n" +
        to_string(errinfo_backtrace(stack)), file, line);
    if (Assertion::throwOnAssertion)
        throw boost::enable_current_exception(Assertion(expr))
            << boost::throw_function(function)
            << boost::throw_file(file)
            << boost::throw_line(line)
            << errinfo_backtrace(stack);
    std::terminate();
}

}
