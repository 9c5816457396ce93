//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// Replica logs through loguru built with fmt support, so LOG_F, DLOG_F,
// CHECK_F and friends all take fmt format strings. The build defines
// LOGURU_USE_FMTLIB=1 for every target that includes this header.

#if !defined(LOGURU_USE_FMTLIB) || !LOGURU_USE_FMTLIB
#  error "Replica requires loguru with LOGURU_USE_FMTLIB=1"
#endif

#include <loguru.hpp>
