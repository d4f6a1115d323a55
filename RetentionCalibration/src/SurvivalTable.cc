/**
 * @file SurvivalTable.cc
 * @brief Implementation of the observed survival table
 */

#include "SurvivalTable.hh"
#include "RetentionErrors.hh"
#include <cmath>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>

namespace RetentionCalibration {

SurvivalTable::SurvivalTable(const std::vector<double>& counts)
    : m_initialPopulation(0.0)
{
    if (counts.size() < 2) {
        throw InvalidInputError("SurvivalTable: need at least two counts (initial cohort and one period)");
    }

    for (size_t i = 0; i < counts.size(); ++i) {
        if (!std::isfinite(counts[i]) || counts[i] < 0.0) {
            std::ostringstream msg;
            msg << "SurvivalTable: count at period " << i << " must be a finite non-negative number, got "
                << counts[i];
            throw InvalidInputError(msg.str());
        }
        if (i > 0 && counts[i] > counts[i - 1]) {
            std::ostringstream msg;
            msg << "SurvivalTable: counts must be non-increasing, period " << i << " has "
                << counts[i] << " after " << counts[i - 1];
            throw InvalidInputError(msg.str());
        }
    }

    if (!(counts[0] > 0.0)) {
        throw InvalidInputError("SurvivalTable: initial cohort size must be positive");
    }

    m_initialPopulation = counts[0];

    const size_t T = counts.size() - 1;
    m_period.reserve(T);
    m_remaining.reserve(T);
    m_lost.reserve(T);
    m_isFinal.reserve(T);

    for (size_t t = 1; t <= T; ++t) {
        m_period.push_back(static_cast<int>(t));
        m_remaining.push_back(counts[t]);
        m_lost.push_back(counts[t - 1] - counts[t]);
        m_isFinal.push_back(t == T);
    }
}

int SurvivalTable::size() const {
    return static_cast<int>(m_period.size());
}

double SurvivalTable::initialPopulation() const {
    return m_initialPopulation;
}

const std::vector<int>& SurvivalTable::periods() const {
    return m_period;
}

const std::vector<double>& SurvivalTable::remaining() const {
    return m_remaining;
}

const std::vector<double>& SurvivalTable::lost() const {
    return m_lost;
}

const std::vector<bool>& SurvivalTable::isFinalPeriod() const {
    return m_isFinal;
}

double SurvivalTable::finalRemaining() const {
    return m_remaining.back();
}

std::vector<double> SurvivalTable::survivalFractions() const {
    std::vector<double> sf;
    sf.reserve(m_remaining.size());
    for (double r : m_remaining) {
        sf.push_back(r / m_initialPopulation);
    }
    return sf;
}

void SurvivalTable::print() const {
    std::cout << std::setw(10) << "Period"
              << std::setw(15) << "Remaining"
              << std::setw(12) << "Lost"
              << std::setw(10) << "Final" << "\n";
    std::cout << "  " << std::string(45, '-') << "\n";
    std::cout << std::setw(10) << 0
              << std::setw(15) << std::fixed << std::setprecision(1) << m_initialPopulation
              << std::setw(12) << "-"
              << std::setw(10) << "-" << "\n";
    for (size_t i = 0; i < m_period.size(); ++i) {
        std::cout << std::setw(10) << m_period[i]
                  << std::setw(15) << std::fixed << std::setprecision(1) << m_remaining[i]
                  << std::setw(12) << m_lost[i]
                  << std::setw(10) << (m_isFinal[i] ? "yes" : "no") << "\n";
    }
}

} // namespace RetentionCalibration
