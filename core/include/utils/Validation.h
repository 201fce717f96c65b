#ifndef VALIDATION_H
#define VALIDATION_H

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

// ---------- Validation Helpers ----------
// require*: configuration checks, always on, throw std::invalid_argument.
// check*:   internal invariant checks, debug builds only, throw std::logic_error.
namespace validation {

inline std::string describe(double value) {
    std::string s = std::to_string(value);
    // trim trailing zeros from std::to_string's fixed 6 digits
    const auto dot = s.find('.');
    if (dot != std::string::npos) {
        const auto last = s.find_last_not_of('0');
        s.erase(last == dot ? dot : last + 1);
    }
    return s;
}

inline void requireFinite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string(name) + " must be finite (got " + describe(value) + ")");
    }
}

inline void requirePositive(double value, const char* name) {
    requireFinite(value, name);
    if (value <= 0.0) {
        throw std::invalid_argument(std::string(name) + " must be > 0 (got " + describe(value) + ")");
    }
}

inline void requireNonNegative(double value, const char* name) {
    requireFinite(value, name);
    if (value < 0.0) {
        throw std::invalid_argument(std::string(name) + " must be >= 0 (got " + describe(value) + ")");
    }
}

inline void requireInRange(double value, double lo, double hi, const char* name) {
    requireFinite(value, name);
    if (value < lo || value > hi) {
        throw std::invalid_argument(std::string(name) + " must be in [" + describe(lo) + ", " +
                                    describe(hi) + "] (got " + describe(value) + ")");
    }
}

inline void requireProbability(double value, const char* name) {
    requireInRange(value, 0.0, 1.0, name);
}

#ifndef NDEBUG
inline void checkUnitInterval(double value, const char* where) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::logic_error(std::string("value outside [0,1] in ") + where + ": " + describe(value));
    }
}

inline void checkNonDecreasing(double before, double after, const char* where) {
    if (after < before) {
        throw std::logic_error(std::string("accumulator decreased in ") + where + ": " +
                               describe(before) + " -> " + describe(after));
    }
}

inline void checkIndex(std::size_t index, std::size_t size, const char* where) {
    if (index >= size) {
        throw std::logic_error(std::string("index out of range in ") + where + ": " +
                               std::to_string(index) + " >= " + std::to_string(size));
    }
}
#else
inline void checkUnitInterval(double, const char*) {}
inline void checkNonDecreasing(double, double, const char*) {}
inline void checkIndex(std::size_t, std::size_t, const char*) {}
#endif

} // namespace validation

#endif
