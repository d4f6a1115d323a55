#ifndef RETENTION_ERRORS_HH
#define RETENTION_ERRORS_HH

/**
 * @file RetentionErrors.hh
 * @brief Exceptions raised by the retention calibration module
 *
 * Only malformed caller input is reported by exception. Infeasible
 * parameters met during the search are absorbed by the likelihood as a
 * penalty, and a search that fails to converge is reported through
 * FitResult::converged.
 */

#include <stdexcept>
#include <string>

namespace RetentionCalibration {

/**
 * @brief Malformed survival sequence, horizon, population or parameters
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace RetentionCalibration

#endif // RETENTION_ERRORS_HH
