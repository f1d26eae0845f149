#include "rcflex/material.hpp"
#include "rcflex/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rcflex {

Concrete::Concrete(double fc, std::string name, double lambda)
    : name(std::move(name)), fc(fc), lambda(lambda) {
    if (!(fc > 0.0)) {
        throw InputError(RcflexError::invalid_material("fc", fc));
    }
    if (!(lambda > 0.0)) {
        throw InputError(RcflexError::invalid_material("lambda", lambda));
    }
    Ec = compute_Ec(fc);
    beta1 = compute_beta1(fc);
}

double Concrete::compute_Ec(double fc) {
    return 4700.0 * std::sqrt(fc);
}

double Concrete::compute_beta1(double fc) {
    if (fc <= 28.0) return 0.85;
    if (fc >= 55.0) return 0.65;
    return std::clamp(0.85 - 0.05 * (fc - 28.0) / 7.0, 0.65, 0.85);
}

ReinforcingSteel::ReinforcingSteel(double fy, std::string name, double Es)
    : name(std::move(name)), fy(fy), Es(Es) {
    if (!(fy > 0.0)) {
        throw InputError(RcflexError::invalid_material("fy", fy));
    }
    if (!(Es > 0.0)) {
        throw InputError(RcflexError::invalid_material("Es", Es));
    }
}

double ReinforcingSteel::stress(double strain) const {
    double fs = std::min(std::abs(strain) * Es, fy);
    return strain < 0.0 ? -fs : fs;
}

} // namespace rcflex
