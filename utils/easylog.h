#pragma once

#include <ylt/easylog.hpp>

// Trace logs are noisy (one line per task or per record), thus disabled by default.
#if defined(ENABLES_VNEPLOG_TRACE) && !defined(DISABLES_VNEPLOG_DEBUG)
  #define VNEPLOG_TRACE(...) ELOG_TRACE << (__VA_ARGS__)
  #define VNEPLOG_FMT_TRACE(...) ELOGFMT(TRACE, __VA_ARGS__)
#else
  #define VNEPLOG_TRACE(...) (void)0
  #define VNEPLOG_FMT_TRACE(...) (void)0
#endif

#if !defined(DISABLES_VNEPLOG_DEBUG)
  #define VNEPLOG_DEBUG(...) ELOG_DEBUG << (__VA_ARGS__)
  #define VNEPLOG_FMT_DEBUG(...) ELOGFMT(DEBUG, __VA_ARGS__)
#else
  #define VNEPLOG_DEBUG(...) (void)0
  #define VNEPLOG_FMT_DEBUG(...) (void)0
#endif
