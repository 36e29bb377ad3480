/**
 * @file placement_parser.hpp
 * @brief コマンドラインの配置指定（NAME=F,R,Y,X）のパーサー
 */
#ifndef QUADRILLION_PLACEMENT_PARSER_HPP
#define QUADRILLION_PLACEMENT_PARSER_HPP

#include "quadrillion/shape.hpp"
#include <string>
#include <utility>

namespace quadrillion {
namespace cli {

/**
 * @brief "NAME=flips,rotations,row,column" を解析
 * @throws std::runtime_error 書式が不正な場合
 */
std::pair<std::string, Placement> parse_placement(const std::string& text);

} // namespace cli
} // namespace quadrillion

#endif // QUADRILLION_PLACEMENT_PARSER_HPP
