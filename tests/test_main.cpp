/**
 * OpenETAS Test Runner
 *
 * Main entry point for running all unit tests.
 */

#include "test_framework.hpp"
#include <iostream>
#include <string>
#include <cstring>

using namespace openetas::test;

// All test files are compiled together, tests are auto-registered

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [suite_name]\n"
              << "\nOptions:\n"
              << "  -h, --help     Show this help message\n"
              << "  -l, --list     List all test suites\n"
              << "\nIf suite_name is provided, only that suite will run.\n"
              << "Otherwise, all tests will run.\n";
}

int main(int argc, char* argv[]) {
    std::cout << R"(
╔══════════════════════════════════════════════════════════════╗
║                    OpenETAS Test Suite                       ║
║          ETAS Inversion, Simulation and Forecasting          ║
╚══════════════════════════════════════════════════════════════╝
)" << std::endl;

    std::string suite_filter;
    bool list_only = false;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--list") == 0) {
            list_only = true;
        } else if (argv[i][0] != '-') {
            suite_filter = argv[i];
        }
    }

    if (list_only) {
        std::cout << "Available test suites:\n";
        for (const auto& name : TestRegistry::instance().suiteNames()) {
            std::cout << "  " << name << "\n";
        }
        return 0;
    }

    std::vector<TestResult> results;

    if (suite_filter.empty()) {
        results = TestRegistry::instance().runAll();
    } else {
        if (!TestRegistry::instance().hasSuite(suite_filter)) {
            std::cerr << "Unknown suite: " << suite_filter << std::endl;
            return 1;
        }
        results = TestRegistry::instance().runSuite(suite_filter);
    }

    printSummary(results);

    // Return error code if any tests failed
    for (const auto& r : results) {
        if (!r.passed) {
            return 1;
        }
    }

    return 0;
}
