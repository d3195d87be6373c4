#ifndef CPP_ZMQ_PLUGIN_SRC_UTIL_THREAD_HPP_
#define CPP_ZMQ_PLUGIN_SRC_UTIL_THREAD_HPP_

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wstrict-aliasing"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <boost/thread/thread.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/once.hpp>
#pragma GCC diagnostic pop

/* This header encapsulates our use of threads, locking structures and
   one-time initialization. Should we switch to std::thread, std::mutex
   and std::call_once, only the aliases below have to change.
*/

namespace ZmqPlugin {
namespace Util {

using thread = boost::thread;
using mutex = boost::mutex;
using once_flag = boost::once_flag;

template <class T>
using lock_guard = boost::lock_guard<T>;

template <class T>
using unique_lock = boost::unique_lock<T>;

using boost::call_once;

}  // namespace Util
}  // namespace ZmqPlugin

#endif  // CPP_ZMQ_PLUGIN_SRC_UTIL_THREAD_HPP_
