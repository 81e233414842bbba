#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "gtest/gtest.h"

namespace oibox::test {

/**
 * @brief expected 中的每个字段都出现在 actual 中并且相等，数组要求逐项包含
 */
inline bool json_contains(const nlohmann::json &actual, const nlohmann::json &expected) {
    if (expected.is_object()) {
        if (!actual.is_object()) return false;
        for (auto it = expected.begin(); it != expected.end(); ++it) {
            if (!actual.count(it.key()) || !json_contains(actual.at(it.key()), it.value()))
                return false;
        }
        return true;
    }
    if (expected.is_array()) {
        if (!actual.is_array() || actual.size() != expected.size()) return false;
        for (size_t i = 0; i < expected.size(); ++i)
            if (!json_contains(actual[i], expected[i])) return false;
        return true;
    }
    return actual == expected;
}

inline std::string describe_mismatch(const char *relation,
                                     const char *lhs_expression, const char *rhs_expression,
                                     const nlohmann::json &lhs, const nlohmann::json &rhs) {
    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << "      Which is: " << std::endl
       << lhs.dump(2) << std::endl
       << relation << rhs_expression << std::endl
       << "      Which is: " << std::endl
       << rhs.dump(2) << std::endl
       << "      Difference: " << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ss.str();
}

inline ::testing::AssertionResult jsonEqual(const char *lhs_expression,
                                            const char *rhs_expression,
                                            const nlohmann::json &lhs,
                                            const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << describe_mismatch("To be equal to: ", lhs_expression, rhs_expression, lhs, rhs);
}

inline ::testing::AssertionResult jsonContains(const char *lhs_expression,
                                               const char *rhs_expression,
                                               const nlohmann::json &lhs,
                                               const nlohmann::json &rhs) {
    if (json_contains(lhs, rhs)) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << describe_mismatch("To contain: ", lhs_expression, rhs_expression, lhs, rhs);
}

}  // namespace oibox::test

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_PRED_FORMAT2(::oibox::test::jsonEqual, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_PRED_FORMAT2(::oibox::test::jsonEqual, obj1, obj2)

#define EXPECT_JSON_CONTAINS(obj1, obj2) \
    EXPECT_PRED_FORMAT2(::oibox::test::jsonContains, obj1, obj2)

#define ASSERT_JSON_CONTAINS(obj1, obj2) \
    ASSERT_PRED_FORMAT2(::oibox::test::jsonContains, obj1, obj2)
