//=============================================================================
// slip Tests - Main Entry Point
//=============================================================================

// Include C++ standard headers BEFORE boost/ut.hpp
#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>

int main() {
    // Boost UT v2 automatically discovers and runs all suites in this binary
}
