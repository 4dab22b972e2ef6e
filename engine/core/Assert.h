#pragma once

#include <cstdlib>
#include <spdlog/spdlog.h>

// Fatal precondition check. The message is an fmt format string followed by
// its arguments. Flushes the log before aborting.
#if !defined(LMX_ASSERT)
#define LMX_ASSERT(expr, ...)                                                  \
  do {                                                                         \
    if (!(expr)) {                                                             \
      spdlog::critical("LMX_ASSERT({}) failed at {}:{}: {}", #expr, __FILE__,  \
                       __LINE__, fmt::format(__VA_ARGS__));                    \
      spdlog::default_logger()->flush();                                       \
      std::abort();                                                            \
    }                                                                          \
  } while (false)
#endif
