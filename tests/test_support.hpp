#ifndef CLARO_TESTS_TEST_SUPPORT_HPP
#define CLARO_TESTS_TEST_SUPPORT_HPP

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

// Expression must throw ExType (or a subclass).
#define REQUIRE_THROWS(expr, ExType, msg)                                       \
    do {                                                                        \
        bool threw_ = false;                                                    \
        try {                                                                   \
            (void)(expr);                                                       \
        } catch (const ExType&) {                                               \
            threw_ = true;                                                      \
        }                                                                       \
        REQUIRE(threw_, msg << " (expected " #ExType ")");                      \
    } while (0)

namespace claro_test {

static inline void requireClose(const char* name, double a, double b, double absTol) {
    if (!std::isfinite(a) || !std::isfinite(b) || std::abs(a - b) > absTol) {
        std::cerr << "[FAIL] " << name << ": " << a << " vs " << b
                  << " (tol " << absTol << ")\n";
        std::exit(1);
    }
}

static inline void pass(const std::string& name) {
    std::cout << "[PASS] " << name << "\n";
}

} // namespace claro_test

#endif // CLARO_TESTS_TEST_SUPPORT_HPP
