#pragma once

#include <cstdint>

#include <boost/format.hpp>

#include "logging.hpp"

namespace ranksim {

// Reports the completion of a loop over [0, total) every delta percent.
// Purely observational: a computation given no reporter behaves the same.
struct progress_printout {
    progress_printout(uint64_t total, uint64_t delta = 10)
        : m_total(total)
        , m_delta(delta)
        , m_last(0)
    {}

    void printout(uint64_t i) {
        if (!m_total) return;
        uint64_t cur = 100 * i / m_total;
        if (cur >= m_last + m_delta) {
            RANKSIM_LOG << boost::format("Current progress: %1% %%...") % cur;
            m_last = cur;
        }
        if (i + 1 == m_total) {
            m_last = 100;
            RANKSIM_LOG << "Current progress: 100 %...";
            RANKSIM_LOG << "Finished!";
        }
    }

    // reuse for another loop, keeping the granularity
    void restart(uint64_t total) {
        m_total = total;
        m_last = 0;
    }

    uint64_t last_reported() const {
        return m_last;
    }

    uint64_t total() const {
        return m_total;
    }

private:
    uint64_t m_total;
    uint64_t m_delta;
    uint64_t m_last;
};

}  // namespace ranksim
