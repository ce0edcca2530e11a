#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "errors.hpp"

namespace ranksim {

class configuration {
public:
    static configuration const& get() {
        static configuration instance;
        return instance;
    }

    double persistence;
    uint64_t progress_delta;
    double bounds_epsilon;
    std::string log_file;

private:
    configuration() {
        fillvar("RANKSIM_PERSISTENCE", persistence, 0.98);
        fillvar("RANKSIM_PROGRESS_DELTA", progress_delta, uint64_t(10));
        fillvar("RANKSIM_BOUNDS_EPSILON", bounds_epsilon, 1e-15);
        fillvar("RANKSIM_LOG_FILE", log_file, std::string());

        if (!(persistence > 0.0 && persistence < 1.0)) {
            throw invalid_parameter_error(
                (boost::format("RANKSIM_PERSISTENCE must lie in (0, 1), got %1%") % persistence).str());
        }
        if (progress_delta == 0) {
            throw invalid_parameter_error("RANKSIM_PROGRESS_DELTA must be at least 1");
        }
        if (!(bounds_epsilon > 0.0)) {
            throw invalid_parameter_error(
                (boost::format("RANKSIM_BOUNDS_EPSILON must be positive, got %1%") % bounds_epsilon).str());
        }
    }

    template <typename T>
    void fillvar(const char* envvar, T& var, T def) {
        const char* val = std::getenv(envvar);
        if (!val || !strlen(val)) {
            var = def;
        } else {
            var = boost::lexical_cast<T>(val);
        }
    }
};

}  // namespace ranksim
