/**
 * @file test_errors.cpp
 * @brief Unit tests for exception trace rendering.
 */

#include "core/errors.hpp"

#include <gtest/gtest.h>
#include <exception>
#include <stdexcept>
#include <string>

using namespace dagbuild;

namespace {

std::exception_ptr capture(auto&& thrower) {
    try {
        thrower();
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}

}  // namespace

TEST(DescribeExceptionTest, StandardException) {
    auto eptr = capture([] { throw std::runtime_error("boom"); });
    EXPECT_EQ(describe_exception(eptr), "std::runtime_error: boom");
}

TEST(DescribeExceptionTest, ProjectExceptionTypeIsDemangled) {
    auto eptr = capture([] { throw TaskBuildError("exit 3"); });
    EXPECT_EQ(describe_exception(eptr), "dagbuild::TaskBuildError: exit 3");
}

TEST(DescribeExceptionTest, NestedExceptionsAreIndented) {
    auto eptr = capture([] {
        try {
            try {
                throw std::invalid_argument("root cause");
            } catch (...) {
                std::throw_with_nested(std::runtime_error("middle"));
            }
        } catch (...) {
            std::throw_with_nested(StatusTransitionError("outer"));
        }
    });

    const auto trace = describe_exception(eptr);
    EXPECT_EQ(trace.substr(0, trace.find('\n')), "dagbuild::StatusTransitionError: outer");
    EXPECT_NE(trace.find("\n  caused by: "), std::string::npos);
    EXPECT_NE(trace.find(": middle"), std::string::npos);
    EXPECT_NE(trace.find("\n    caused by: std::invalid_argument: root cause"), std::string::npos);
}

TEST(DescribeExceptionTest, IsolatedBuildErrorIsVerbatim) {
    const std::string trace = "std::runtime_error: failed in worker";
    auto eptr = capture([&] { throw IsolatedBuildError(trace); });
    EXPECT_EQ(describe_exception(eptr), trace);
}

TEST(DescribeExceptionTest, NonStandardThrowables) {
    EXPECT_EQ(describe_exception(capture([] { throw std::string("text"); })),
              "std::string: text");
    EXPECT_EQ(describe_exception(capture([] { throw "literal"; })),
              "const char*: literal");
    EXPECT_EQ(describe_exception(capture([] { throw 42; })), "unknown exception");
}

TEST(DescribeExceptionTest, NullPointerRendersEmpty) {
    EXPECT_EQ(describe_exception(nullptr), "");
}

TEST(IsolatedBuildErrorTest, CarriesTrace) {
    IsolatedBuildError err("line one\nline two");
    EXPECT_EQ(err.trace(), "line one\nline two");
    EXPECT_STREQ(err.what(), "line one\nline two");
}
