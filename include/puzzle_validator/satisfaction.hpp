/**
 * @file satisfaction.hpp
 * @brief 確定値の割り当てと制約判定結果の型
 */
#ifndef PUZZLE_VALIDATOR_SATISFACTION_HPP
#define PUZZLE_VALIDATOR_SATISFACTION_HPP

#include "puzzle_validator/domain.hpp"
#include <vector>
#include <optional>

namespace puzzle_validator {

/**
 * @brief 変数インデックス -> 確定値（未確定なら std::nullopt）
 */
using Assignment = std::vector<std::optional<Domain::value_type>>;

/**
 * @brief 部分割り当てに対する制約の判定結果
 */
enum class Satisfaction {
    Satisfied,     // 全変数確定かつ充足
    Violated,      // 確定済みの値だけで既に違反
    Undetermined   // 未確定の変数が残っており判定不能
};

/**
 * @brief 判定結果の名前（ログ用）
 */
inline const char* to_string(Satisfaction s) {
    switch (s) {
        case Satisfaction::Satisfied: return "satisfied";
        case Satisfaction::Violated: return "violated";
        case Satisfaction::Undetermined: return "undetermined";
    }
    return "unknown";
}

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_SATISFACTION_HPP
