/**
 * @file shape.hpp
 * @brief 図形クラス（反転・回転・平行移動による配置）
 */
#ifndef QUADRILLION_SHAPE_HPP
#define QUADRILLION_SHAPE_HPP

#include "quadrillion/cell.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace quadrillion {

/**
 * @brief 図形の配置（反転回数, 時計回り回転回数, 平行移動量）
 *
 * Shape::set_placement() を通すと flips は mod 2、rotations は mod 4 に正規化される。
 */
struct Placement {
    int flips = 0;
    int rotations = 0;
    Cell location{0, 0};

    /**
     * @brief flips / rotations を正規の範囲に収めた配置を返す
     */
    Placement normalized() const;

    bool operator==(const Placement& other) const {
        return flips == other.flips && rotations == other.rotations && location == other.location;
    }
    bool operator!=(const Placement& other) const { return !(*this == other); }
    bool operator<(const Placement& other) const;
};

/**
 * @brief 盤面上に置く剛体図形
 *
 * 不変の識別子（正準パターン = 原点に寄せた初期セル集合）と、
 * 可変の配置（Placement）を分離して保持する。
 * 等価性とハッシュは正準パターンのみで決まり、現在の配置には依存しない。
 *
 * 配置の変更は必ず set_placement() を経由する。
 * flip() / rotate() / move() / reset() / set_cells() もすべて set_placement() を呼ぶ。
 */
class Shape {
public:
    /**
     * @brief 図形を作成
     * @param name 図形名
     * @param cells 図形を構成するセル（row, column ともに 0 以上）
     * @param initial 初期配置
     * @throws InvalidGeometryError セルが空、または負の座標を含む場合
     */
    Shape(std::string name, const CellSet& cells, Placement initial = Placement{});

    virtual ~Shape() = default;

    Shape(const Shape&) = delete;
    Shape& operator=(const Shape&) = delete;

    const std::string& name() const { return name_; }

    /**
     * @brief 正準パターン（変換前のセル集合）
     */
    const CellSet& pattern() const { return pattern_; }

    /**
     * @brief 現在の配置で占有しているセル
     */
    const CellSet& cells() const { return cells_; }

    size_t size() const { return cells_.size(); }

    /**
     * @brief 変換の基準となるバウンディングボックスの高さ・幅
     */
    int height() const { return height_; }
    int width() const { return width_; }

    bool contains(Cell cell) const { return cells_.count(cell) > 0; }

    const Placement& placement() const { return placement_; }
    const Placement& initial_placement() const { return initial_; }

    /**
     * @brief 配置を設定（図形を動かす唯一の経路）
     */
    void set_placement(const Placement& placement);

    /**
     * @brief 初期配置に戻す
     */
    void reset();

    /**
     * @brief 上下反転（回転の向きも反転する）
     */
    void flip();

    /**
     * @brief 90度回転
     * @param clockwise true なら時計回り
     */
    void rotate(bool clockwise);

    /**
     * @brief 平行移動
     */
    void move(Cell delta);

    /**
     * @brief 指定配置での占有セルを計算（反転 → 回転 → 平行移動の順）
     */
    virtual CellSet configured(const Placement& placement) const;

    /**
     * @brief 指定位置において幾何的に異なる配置をすべて列挙
     *
     * 原点で反転×回転の 8 通りを試し、結果のパターンが等しいものを除いて
     * location に付け直す。結果の数は 8 / 対称群の位数（1, 2, 4, 8）。
     * 正準な組み合わせは初回呼び出し時に一度だけ計算して保持する。
     */
    std::vector<Placement> unique_configs_at(Cell location) const;

    /**
     * @brief 図形の対称群の位数（8 / 正準配置数）
     */
    size_t symmetry_order() const;

    /**
     * @brief セル集合から配置を逆算して設定
     *
     * cells の最小 (row, column) を位置として unique_configs_at() を線形探索する。
     * @throws InvalidPlacementError どの正準配置も cells を再現しない場合
     */
    void set_cells(const CellSet& cells);

    bool operator==(const Shape& other) const { return same_identity(other); }
    bool operator!=(const Shape& other) const { return !same_identity(other); }

    /**
     * @brief 識別子のハッシュ値
     */
    virtual size_t identity_hash() const;

protected:
    /**
     * @brief 派生クラス用（パターンは base_pattern() で与える）
     * @note 派生クラスのコンストラクタで reset() を呼ぶこと
     */
    Shape(std::string name, int height, int width, Placement initial);

    /**
     * @brief 反転回数に応じた変換前のパターン
     */
    virtual const CellSet& base_pattern(int flips) const;

    virtual bool same_identity(const Shape& other) const;

    /**
     * @brief base_pattern() に回転と平行移動を適用
     */
    CellSet transformed(const Placement& placement) const;

private:
    std::string name_;
    CellSet pattern_;
    CellSet flipped_pattern_;
    int height_ = 0;
    int width_ = 0;
    Placement initial_;
    Placement placement_;
    CellSet cells_;

    // 正準配置（原点基準）のメモ
    mutable std::vector<Placement> unique_configs_;
    mutable bool unique_configs_ready_ = false;
};

using ShapePtr = std::shared_ptr<Shape>;

} // namespace quadrillion

namespace std {
template <>
struct hash<quadrillion::Shape> {
    size_t operator()(const quadrillion::Shape& s) const noexcept {
        return s.identity_hash();
    }
};
} // namespace std

#endif // QUADRILLION_SHAPE_HPP
