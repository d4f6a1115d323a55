#ifndef RETENTION_LOGGING_HH
#define RETENTION_LOGGING_HH

/**
 * @file Logging.hh
 * @brief Diagnostic output of the fitting procedure
 *
 * Messages go to std::cerr so they never mix with the print() reports on
 * std::cout. The argument is a stream expression:
 *   RETENTION_LOGV(RETENTION_LOG_INFO, "gamma=" << gamma);
 *
 * Verbosity is fixed at compile time with -DRETENTION_VERBOSE=<level>.
 */

#include <iostream>

// 0: silent, 1: warnings, 2: fit summaries, 3: every start
#ifndef RETENTION_VERBOSE
#define RETENTION_VERBOSE 2
#endif

#define RETENTION_LOG_WARN 1
#define RETENTION_LOG_INFO 2
#define RETENTION_LOG_DEBUG 3

#define RETENTION_LOGV(LVL, EXPR) \
    do { \
        if (RETENTION_VERBOSE >= (LVL)) { \
            std::cerr << ((LVL) == RETENTION_LOG_WARN ? "[warning] " : (LVL) == RETENTION_LOG_INFO ? "[info] " : "[debug] ") << EXPR << std::endl; \
        } \
    } while (0)

#endif // RETENTION_LOGGING_HH
