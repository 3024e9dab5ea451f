#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "common/status.hpp"
#include "gtest/gtest.h"

/**
 * 测试用的断言
 * 断言失败时输出两个 JSON 对象的完整内容和 JSON Patch 形式的差异，
 * 以及执行结果的字符串形式
 */

inline ::testing::AssertionResult jsonEqual(const char *lhs_expression,
                                            const char *rhs_expression,
                                            const nlohmann::json &lhs,
                                            const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << lhs.dump(2) << std::endl
       << "To be equal to: " << rhs_expression << std::endl
       << rhs.dump(2) << std::endl
       << "     Difference: " << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

inline ::testing::AssertionResult outcomeIs(const char *result_expression,
                                            const char *,
                                            const codeeval::execution_outcome &result,
                                            codeeval::status expected) {
    if (codeeval::get_status(result) == expected) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << result_expression << " is \"" << codeeval::to_result_string(result)
           << "\", expected " << codeeval::get_display_message(expected);
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define EXPECT_OUTCOME(result, expected) \
    EXPECT_PRED_FORMAT2(outcomeIs, result, expected)

#define ASSERT_OUTCOME(result, expected) \
    ASSERT_PRED_FORMAT2(outcomeIs, result, expected)
