#ifndef TEST_H
#define TEST_H

#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>

#include "error.hpp"

namespace fs = std::filesystem;

// print the failed condition and leave the test function
#define CHECK(cond)                                                              \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cout << "Error: " #cond " failed at " << __FILE__ << ":"        \
                      << __LINE__ << std::endl;                                  \
            return false;                                                        \
        }                                                                        \
    } while (0)

#define CHECK_NEAR(a, b, tol)                                                    \
    do {                                                                         \
        const double _va = (a), _vb = (b);                                       \
        if (!(std::fabs(_va - _vb) <= (tol))) {                                  \
            std::cout << "Error: " #a " = " << _va << ", expected " << _vb       \
                      << " (tol " << (tol) << ") at " << __FILE__ << ":"         \
                      << __LINE__ << std::endl;                                  \
            return false;                                                        \
        }                                                                        \
    } while (0)

// true if the call throws FatalError with this code
#define CHECK_THROW_CODE(call, err_code)                                         \
    do {                                                                         \
        bool _is_thrown = false;                                                 \
        try {                                                                    \
            call;                                                                \
        } catch (FatalError const& _e) {                                         \
            _is_thrown = (_e.code() == (err_code));                              \
            if (!_is_thrown) std::cout << "Unexpected: " << _e.what() << std::endl; \
        }                                                                        \
        if (!_is_thrown) {                                                       \
            std::cout << "Error: " #call " did not throw " #err_code " at "      \
                      << __FILE__ << ":" << __LINE__ << std::endl;               \
            return false;                                                        \
        }                                                                        \
    } while (0)

// fresh folder for the outputs of one test
inline std::string makeResultDir (std::string const& name)
{
    std::string dir = "test_results/" + name + "/";
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

// returns 1 on failure, exceptions count as failure
inline int runTest (std::string const& name, bool (*test)())
{
    bool is_passed = false;
    try
    {
        is_passed = test();
    }
    catch (FatalError const& e)
    {
        std::cout << "Exception: " << e.what() << std::endl;
    }
    catch (std::exception const& e)
    {
        std::cout << "std::exception: " << e.what() << std::endl;
    }
    std::cout << name << (is_passed ? ": passed" : ": FAILED") << std::endl;
    return is_passed ? 0 : 1;
}

#endif
