#include "quadrillion/catalog.hpp"
#include "quadrillion/errors.hpp"
#include "quadrillion/puzzle_adapter.hpp"
#include "placement_parser.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] [-s] [-H N] [-g NAME=F,R,Y,X]...\n";
    std::cerr << "  -v              Verbose mode (print search progress)\n";
    std::cerr << "  -s              Print solver statistics to stderr\n";
    std::cerr << "  -H N            Place N hinted shapes instead of solving the whole board\n";
    std::cerr << "  -g NAME=F,R,Y,X Initial placement of a grid or shape (flips, rotations, row, column)\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const quadrillion::PuzzleAdapter& adapter) {
    if (!g_print_stats) return;
    const auto& s = adapter.stats();
    std::cerr << "Stats: searches=" << s.search_count
              << " cache_hits=" << s.cache_hits
              << " domain_values=" << s.domain_values
              << " nodes=" << s.solver.node_count
              << " fails=" << s.solver.fail_count
              << " inferred=" << s.solver.inferred_count
              << " max_depth=" << s.solver.max_depth
              << " seconds=" << s.last_search_seconds
              << "\n";
}

/**
 * @brief 盤面を文字で表示
 *
 * 図形は名前の1文字目、閉じたドットは '#'、空いた開セルは '.'。
 */
void print_board(const quadrillion::Board& board) {
    auto [rows, cols] = board.dot_space();
    std::vector<std::string> canvas(rows, std::string(cols, ' '));

    for (const auto& grid : board.released_grids()) {
        for (const auto& [y, x] : grid->open_cells()) canvas[y][x] = '.';
        for (const auto& [y, x] : grid->closed_cells()) canvas[y][x] = '#';
    }
    for (const auto& shape : board.shapes()) {
        for (const auto& [y, x] : shape->cells()) {
            if (y >= 0 && y < rows && x >= 0 && x < cols) canvas[y][x] = shape->name()[0];
        }
    }

    for (const auto& line : canvas) {
        auto end = line.find_last_not_of(' ');
        std::cout << (end == std::string::npos ? "" : line.substr(0, end + 1)) << "\n";
    }
    std::cout << "----------\n";
}

int main(int argc, char* argv[]) {
    int hints = 0;
    quadrillion::catalog::PlacementOverrides overrides;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "-s") == 0) {
                g_print_stats = true;
            } else if (std::strcmp(argv[i], "-v") == 0) {
                g_verbose = true;
            } else if (std::strcmp(argv[i], "-H") == 0 && i + 1 < argc) {
                hints = std::atoi(argv[++i]);
            } else if (std::strcmp(argv[i], "-g") == 0 && i + 1 < argc) {
                auto [name, placement] = quadrillion::cli::parse_placement(argv[++i]);
                overrides[name] = placement;
            } else if (std::strcmp(argv[i], "-h") == 0 ||
                       std::strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 2;
    }

    try {
        auto board = quadrillion::catalog::make_board(overrides);
        quadrillion::PuzzleAdapter adapter(
            *board, quadrillion::FeasibilityRule::from_shapes(board->shapes()));
        adapter.set_verbose(g_verbose);

        print_board(*board);
        if (hints > 0) {
            for (int i = 0; i < hints && !board->is_won(); ++i) {
                adapter.help();
            }
        } else {
            adapter.solve();
        }
        print_board(*board);
        print_stats(adapter);

        std::cout << (board->is_won() ? "=====SOLVED=====" : "=====HINTED=====") << "\n";
    } catch (const quadrillion::NoSolutionError& e) {
        std::cout << "=====UNSATISFIABLE=====\n";
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
