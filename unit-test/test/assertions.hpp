#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "gtest/gtest.h"

/**
 * @brief 比较两个 JSON 对象，失败时输出两者的内容和 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult jsonEqual(const char *lhs_expression,
                                            const char *rhs_expression,
                                            const nlohmann::json &lhs,
                                            const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    auto dump = [](const nlohmann::json &j) {
        return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    };
    return ::testing::AssertionFailure()
           << std::endl
           << lhs_expression << " is:" << std::endl
           << dump(lhs) << std::endl
           << rhs_expression << " is:" << std::endl
           << dump(rhs) << std::endl
           << "patch from left to right:" << std::endl
           << dump(nlohmann::json::diff(lhs, rhs));
}

#define EXPECT_JSON_EQ(obj1, obj2) \
    EXPECT_PRED_FORMAT2(jsonEqual, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) \
    ASSERT_PRED_FORMAT2(jsonEqual, obj1, obj2)
