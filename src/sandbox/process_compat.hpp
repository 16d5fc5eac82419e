#pragma once

#include <boost/version.hpp>

// Boost 1.86 moved the classic Boost.Process API under process/v1 and made
// the unversioned header the v2 API.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
namespace sandcell::sandbox {
namespace bp = boost::process::v1;
}  // namespace sandcell::sandbox
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
namespace sandcell::sandbox {
namespace bp = boost::process;
}  // namespace sandcell::sandbox
#endif
