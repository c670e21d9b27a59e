#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/Board.hpp"
#include "core/BoardConfig.hpp"
#include "core/Shape.hpp"
#include "core/ShapeFactory.hpp"
#include "core/Types.hpp"

using namespace stackfall::core;

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage:\n  " << prog << " [--rows N] [--cols N] [--seed N]\n"
              << "Reads one command per line from stdin.\n";
}

// Overrides config from the command line. Returns false on bad input.
bool parseArgs(int argc, char** argv, BoardConfig& config) {
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "[CONSOLE] Missing value for " << flag << '\n';
            return false;
        }
        const std::string value = argv[++i];

        try {
            if (flag == "--rows") {
                config.rows = std::stoi(value);
            } else if (flag == "--cols") {
                config.cols = std::stoi(value);
            } else if (flag == "--seed") {
                config.seed = static_cast<std::uint32_t>(std::stoul(value));
            } else {
                std::cerr << "[CONSOLE] Unknown option " << flag << '\n';
                return false;
            }
        } catch (const std::exception&) {
            std::cerr << "[CONSOLE] Invalid value for " << flag << ": " << value << '\n';
            return false;
        }
    }

    if (config.rows <= 0 || config.cols <= 0) {
        std::cerr << "[CONSOLE] Board dimensions must be positive\n";
        return false;
    }
    return true;
}

// Helper: render the pile + active shape as ASCII
void printBoard(const Board& board, const std::optional<Shape>& active) {
    const int rows = board.rows();
    const int cols = board.cols();

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (board.occupant(Position{r, c})) {
                lines[r][c] = '#'; // pile
            }
        }
    }

    // Overlay active shape as 'X'
    if (active && active->state() == ShapeState::Active) {
        for (const auto& cell : active->cells()) {
            if (board.isInside(cell.position)) {
                lines[cell.position.row][cell.position.col] = 'X';
            }
        }
    }

    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (const auto& line : lines) {
        std::cout << '|' << line << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  a = left, d = right, s = move down, w = rotate\n"
              << "  h = drop, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    BoardConfig config;
    if (!parseArgs(argc, argv, config)) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Board board{config.rows, config.cols};
        ShapeFactory factory = config.seed == 0
            ? ShapeFactory{&board}
            : ShapeFactory{&board, config.seed};

        std::optional<Shape> active;
        int lockedPieces = 0;

        // Returns false when the new piece does not fit (top out)
        auto spawn = [&]() {
            active.emplace(factory.createRandom(spawnOrigin(config)));
            if (!board.canPlace(*active)) {
                return false;
            }
            board.attach(*active);
            active->onJoinPile([&lockedPieces](const std::vector<Cell>& cells) {
                ++lockedPieces;
                std::cout << "[CONSOLE] Piece " << lockedPieces << " joined the pile ("
                          << cells.size() << " cells)\n";
            });
            return true;
        };

        std::cout << "[CONSOLE] Board " << config.rows << "x" << config.cols << '\n';
        if (!spawn()) {
            std::cout << "[CONSOLE] No room to spawn a piece.\n";
            return 0;
        }

        printHelp();
        printBoard(board, active);

        std::string cmd;
        while (std::getline(std::cin, cmd)) {
            if (cmd.empty()) {
                continue;
            }

            const char c = cmd[0];
            if (c == 'q' || c == 'Q') {
                std::cout << "Quitting.\n";
                break;
            }

            switch (c) {
            case 'a': case 'A':
                active->moveLeft();
                break;
            case 'd': case 'D':
                active->moveRight();
                break;
            case 's': case 'S':
                active->moveDown();
                break;
            case 'w': case 'W':
                active->rotate();
                break;
            case 'h': case 'H': {
                const int rows = active->drop();
                std::cout << "[CONSOLE] Dropped " << rows << " rows\n";
                break;
            }
            default:
                std::cout << "Unknown command: " << c << '\n';
                continue;
            }

            if (active->state() == ShapeState::Joined && !spawn()) {
                printBoard(board, active);
                std::cout << "[CONSOLE] GAME OVER after " << lockedPieces << " pieces.\n";
                break;
            }

            printBoard(board, active);
        }
    } catch (const std::exception& e) {
        std::cerr << "[CONSOLE] Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
