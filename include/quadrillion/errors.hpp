/**
 * @file errors.hpp
 * @brief パズル・盤面操作の例外クラス
 *
 * 探索そのものの失敗（解なし）は例外ではなく std::nullopt で表す。
 * ここに定義する例外は、盤面・図形の不正な操作と、
 * アダプタが外部へ報告する状態エラーに限る。
 */
#ifndef QUADRILLION_ERRORS_HPP
#define QUADRILLION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace quadrillion {

/**
 * @brief 全例外の基底クラス
 */
class QuadrillionError : public std::runtime_error {
public:
    explicit QuadrillionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief 図形の構築時に不正なセル座標が与えられた
 */
class InvalidGeometryError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

/**
 * @brief セル集合がどの正準配置にも対応しない（Shape::set_cells の失敗）
 */
class InvalidPlacementError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

/**
 * @brief 現在の状態では許されない操作
 */
class StateError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

/**
 * @brief 指定位置にアイテムが存在しない
 */
class NoItemError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

class IllegalPickError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

class IllegalReleaseError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

/**
 * @brief 初期配置が盤面規則に違反している
 */
class InitialConfigurationError : public IllegalReleaseError {
public:
    using IllegalReleaseError::IllegalReleaseError;
};

/**
 * @brief 探索が解を見つけられなかった
 */
class NoSolutionError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

/**
 * @brief 内部状態の不整合（momento が合法な配置で保存されていない等）
 */
class InconsistentStateError : public QuadrillionError {
public:
    using QuadrillionError::QuadrillionError;
};

} // namespace quadrillion

#endif // QUADRILLION_ERRORS_HPP
