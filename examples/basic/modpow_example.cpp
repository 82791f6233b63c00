/**
 * @file modpow_example.cpp
 * @brief Modular exponentiation example
 */

#include "accelbn/accelbn.h"
#include "accelbn_api.h"
#include <iostream>

int main() {
    std::cout << "=== accelbn Modular Arithmetic Example ===" << std::endl;
    std::cout << "Library version: " << accelbn_version() << std::endl;
    std::cout << "Platform: " << accelbn_platform() << std::endl;
    std::cout << std::endl;

    if (accelbn_init() != ACCELBN_SUCCESS) {
        std::cerr << "Failed to initialize accelbn" << std::endl;
        return 1;
    }

    std::cout << "CPU type: " << accelbn::cpu_type() << std::endl;
    std::cout << "CPU model: " << accelbn::cpu_model() << std::endl;
    std::cout << "Accelerated: " << (accelbn::is_accelerated() ? "yes" : "no") << std::endl;
    if (accelbn::is_accelerated()) {
        std::cout << "Backend version: " << accelbn::backend_version() << std::endl;
        std::cout << "GMP version: " << accelbn::backend_library_version() << std::endl;
        auto name = accelbn::loaded_candidate_name();
        std::cout << "Loaded: " << (name ? *name : "system library") << std::endl;
    }
    std::cout << "Status: " << accelbn::last_status_message() << std::endl;
    std::cout << std::endl;

    // 2^127 - 1 is prime
    auto p = accelbn::AcceleratedBigInteger::from_string("170141183460469231731687303715884105727");
    accelbn::AcceleratedBigInteger g(3);
    accelbn::AcceleratedBigInteger x = accelbn::AcceleratedBigInteger::from_string(
        "98765432109876543210987654321");

    try {
        auto y = g.mod_pow_ct(x, p);
        auto g_inv = g.mod_inverse(p);
        std::cout << "g^x mod p    = " << y << std::endl;
        std::cout << "g^-1 mod p   = " << g_inv << std::endl;
        std::cout << "4^13 mod 497 = "
                  << accelbn::AcceleratedBigInteger(4).mod_pow(accelbn::AcceleratedBigInteger(13),
                                                               accelbn::AcceleratedBigInteger(497))
                  << std::endl;

        // No inverse: gcd(4, 8) = 2
        accelbn::AcceleratedBigInteger(4).mod_inverse(accelbn::AcceleratedBigInteger(8));
    } catch (const accelbn::ArithmeticError& e) {
        std::cout << "Arithmetic error: " << e.what() << std::endl;
    }

    return 0;
}
