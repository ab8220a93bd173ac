#pragma once

#include <cstdint>

// Frame rate as an exact fraction (e.g. 30000/1001).
struct Rational {
    int num = 0;
    int den = 1;

    bool isValid() const { return num > 0 && den > 0; }
    double toDouble() const { return den != 0 ? static_cast<double>(num) / den : 0.0; }

    bool operator==(const Rational& o) const {
        return static_cast<int64_t>(num) * o.den == static_cast<int64_t>(o.num) * den;
    }
    bool operator!=(const Rational& o) const { return !(*this == o); }
};
