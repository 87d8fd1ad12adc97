/** \brief Unit test macros.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <cstdlib>
#include "util.h"


static std::vector<std::pair<void (*)(), std::string>> tests;
static unsigned success_count, failure_count;


#define TEST_MAIN(name)                                                        \
    int main(int /*argc*/, char *argv[]) {                                     \
        ::progname = argv[0];                                                  \
        std::cerr << "*** " << #name << " ***\n";                              \
        for (const auto &func_and_name : tests) {                              \
            std::cerr << "Calling test \"" << func_and_name.second << "\".\n"; \
            func_and_name.first();                                             \
        }                                                                      \
                                                                               \
        std::cerr << "*** " << success_count << " checks succeeded. ***\n";    \
        std::cerr << "*** " << failure_count << " checks failed. ***\n";       \
        return (failure_count > 0) ? EXIT_FAILURE : EXIT_SUCCESS;              \
    }

#define TEST(test_name)                             \
    static void test_name();                        \
    static int register_##test_name() {             \
        tests.emplace_back(test_name, #test_name);  \
        return 0;                                   \
    }                                               \
    int dummy_##test_name = register_##test_name(); \
    void test_name()


// Records the outcome of a single check.  "description" is only printed for failures.
#define UNIT_TEST_RECORD(condition, description)                                                        \
    do {                                                                                                \
        if ((condition))                                                                                \
            ++success_count;                                                                            \
        else {                                                                                          \
            ++failure_count;                                                                            \
            std::cerr << "\t" << __FILE__ << ":" << __LINE__ << ": Test failed: " << description << '\n'; \
        }                                                                                               \
    } while (0)

#define CHECK_TRUE(a) UNIT_TEST_RECORD((a), #a << " is not true!")
#define CHECK_FALSE(a) UNIT_TEST_RECORD(not(a), #a << " is not false!")
#define CHECK_LT(a, b) UNIT_TEST_RECORD((a) < (b), #a " < " << #b)
#define CHECK_GT(a, b) UNIT_TEST_RECORD((a) > (b), #a " > " << #b)
#define CHECK_LE(a, b) UNIT_TEST_RECORD((a) <= (b), #a " <= " << #b)
#define CHECK_GE(a, b) UNIT_TEST_RECORD((a) >= (b), #a " >= " << #b)
#define CHECK_EQ(a, b) UNIT_TEST_RECORD((a) == (b), #a " == " << #b)
#define CHECK_NE(a, b) UNIT_TEST_RECORD((a) != (b), #a " != " << #b)


// Succeeds iff evaluating "expression" throws an exception of type "exception_type".
#define CHECK_THROWS(expression, exception_type)                   \
    do {                                                           \
        bool caught_expected_exception(false);                     \
        try {                                                      \
            (void)(expression);                                    \
        } catch (const exception_type &) {                         \
            caught_expected_exception = true;                      \
        }                                                          \
        UNIT_TEST_RECORD(caught_expected_exception,                \
                         #expression " did not throw " #exception_type "!"); \
    } while (0)
