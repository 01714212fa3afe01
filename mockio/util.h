#ifndef __MOCKIO_UTIL_H__
#define __MOCKIO_UTIL_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/shared_ptr.hpp>

namespace MockIO {

/// Deleter for a boost::shared_ptr that doesn't own its object
struct NoDelete
{
    template <class T>
    void operator()(T *) const {}
};

/// Hand an object that lives elsewhere (a stream on the test's stack, a
/// singleton) to something that takes a shared_ptr; t must outlive every copy
template <class T>
boost::shared_ptr<T> unmanagedPtr(T &t)
{
    return boost::shared_ptr<T>(&t, NoDelete());
}

}

#endif
