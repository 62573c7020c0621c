/**
 * @file math_utils.h
 * @brief 带溢出检查的整数运算
 *
 * 所有运算在溢出时抛出 ArithmeticOverflowException，从不静默回绕。
 */

#pragma once

#include "isocal/common_utils/utilities/exceptions.h"

#include <cstdint>
#include <limits>

namespace isocal::common_utils {

class MathUtils {
public:
    static int64_t safeAdd(int64_t a, int64_t b) {
        int64_t result;
        if (__builtin_add_overflow(a, b, &result)) {
            ISOCAL_THROW(ArithmeticOverflowException, "Addition overflows a long: " << a << " + " << b);
        }
        return result;
    }

    static int64_t safeSubtract(int64_t a, int64_t b) {
        int64_t result;
        if (__builtin_sub_overflow(a, b, &result)) {
            ISOCAL_THROW(ArithmeticOverflowException, "Subtraction overflows a long: " << a << " - " << b);
        }
        return result;
    }

    static int64_t safeMultiply(int64_t a, int64_t b) {
        int64_t result;
        if (__builtin_mul_overflow(a, b, &result)) {
            ISOCAL_THROW(ArithmeticOverflowException, "Multiplication overflows a long: " << a << " * " << b);
        }
        return result;
    }

    static int64_t safeNegate(int64_t value) {
        if (value == std::numeric_limits<int64_t>::min()) {
            ISOCAL_THROW(ArithmeticOverflowException, "Negation overflows a long: " << value);
        }
        return -value;
    }

    /**
     * @brief 向下取整除法，divisor 必须为正
     */
    static constexpr int64_t floorDiv(int64_t dividend, int64_t divisor) {
        return dividend >= 0 ? dividend / divisor : ((dividend + 1) / divisor) - 1;
    }

    /**
     * @brief 与 floorDiv 配对的取模，结果落在 [0, divisor)
     */
    static constexpr int64_t floorMod(int64_t dividend, int64_t divisor) {
        return ((dividend % divisor) + divisor) % divisor;
    }
};

} // namespace isocal::common_utils
