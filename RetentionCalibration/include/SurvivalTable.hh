#ifndef SURVIVAL_TABLE_HH
#define SURVIVAL_TABLE_HH

/**
 * @file SurvivalTable.hh
 * @brief Observed attrition history of a single customer cohort
 *
 * Built once from the per-period counts of customers still active,
 * starting with the initial cohort size at period 0:
 *
 *   counts = [N0, N1, ..., NT]
 *
 * Periods 1..T carry remaining[t] = Nt and lost[t] = N(t-1) - Nt.
 * Period T is the right-censoring boundary: the remaining customers
 * there are known only to have survived at least T periods.
 */

#include <vector>

namespace RetentionCalibration {

/**
 * @class SurvivalTable
 * @brief Immutable, validated survival table
 */
class SurvivalTable {
public:
    /**
     * @brief Build from the raw sequence of remaining counts
     *
     * @param counts Remaining customers per period, counts[0] = cohort size
     * @throws InvalidInputError if there are fewer than two values, a value
     *         is negative or not finite, the cohort is empty, or the counts
     *         increase from one period to the next
     */
    explicit SurvivalTable(const std::vector<double>& counts);

    /**
     * @brief Number of observed periods T (excluding period 0)
     */
    int size() const;

    /**
     * @brief Cohort size at period 0
     */
    double initialPopulation() const;

    /**
     * @brief Periods 1..T
     */
    const std::vector<int>& periods() const;

    /**
     * @brief Customers active at each period 1..T
     */
    const std::vector<double>& remaining() const;

    /**
     * @brief Customers lost in each period 1..T
     */
    const std::vector<double>& lost() const;

    /**
     * @brief Right-censoring flags, true only for period T
     */
    const std::vector<bool>& isFinalPeriod() const;

    /**
     * @brief Customers still active at the final period T
     */
    double finalRemaining() const;

    /**
     * @brief Fraction of the cohort still active at each period 1..T
     */
    std::vector<double> survivalFractions() const;

    /**
     * @brief Print the table
     */
    void print() const;

private:
    double m_initialPopulation;
    std::vector<int> m_period;
    std::vector<double> m_remaining;
    std::vector<double> m_lost;
    std::vector<bool> m_isFinal;
};

} // namespace RetentionCalibration

#endif // SURVIVAL_TABLE_HH
