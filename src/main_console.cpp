#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/GameState.hpp"
#include "core/ShapeCatalog.hpp"
#include "core/Types.hpp"
#include "controller/CommandLine.hpp"
#include "controller/GameController.hpp"

using namespace blockfall::core;
using blockfall::controller::GameController;
using blockfall::controller::InputAction;

namespace {

std::string kindList(const std::vector<TetrominoType>& kinds) {
    std::string out;
    for (auto k : kinds) {
        if (!out.empty()) out += ' ';
        out += ShapeCatalog::name(k);
    }
    return out;
}

// Name of the kind whose color matches the locked cell, '#' otherwise
char symbolForColor(const Color& color) {
    for (auto k : AllTetrominoTypes) {
        if (ShapeCatalog::color(k) == color) {
            return ShapeCatalog::name(k);
        }
    }
    return '#';
}

// Helper: render the current board + active tetromino as ASCII
void printGame(const GameState& game, const GameController& controller) {
    const GameSnapshot snap = game.snapshot(2);
    const int rows = snap.rows;
    const int cols = snap.cols;

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (const auto& color = snap.cellAt(r, c)) {
                lines[r][c] = symbolForColor(*color);
            }
        }
    }

    auto overlay = [&](const Cells& cells, char ch) {
        for (const auto& b : cells) {
            if (b.row >= 0 && b.row < rows && b.col >= 0 && b.col < cols) {
                lines[b.row][b.col] = ch;
            }
        }
    };
    if (snap.ghost) overlay(snap.ghost->cells, '+');
    if (snap.active) overlay(snap.active->cells, 'X');

    std::cout << "\n==== BLOCKFALL CONSOLE VIEW ====\n";
    std::cout << "Lines: " << snap.linesCleared
              << " | Pieces: " << snap.lockedPieces
              << " | Time: " << std::fixed << std::setprecision(1) << snap.elapsedSeconds << "s"
              << " | Status: ";
    if (snap.gameOver) {
        std::cout << "GameOver";
    } else if (controller.isPaused()) {
        std::cout << "Paused";
    } else {
        std::cout << "Running";
    }
    std::cout << '\n';

    std::cout << "Hold: " << (snap.held ? ShapeCatalog::name(*snap.held) : '-')
              << " | Next: " << kindList(snap.next) << '\n';

    // Print board with borders
    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int r = 0; r < rows; ++r) {
        std::cout << '|' << lines[r] << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, s = soft drop, h = hard drop, c = hold\n"
              << "  w/x = rotate CW, z = rotate CCW\n"
              << "  g = one drop interval of time, t <sec> = advance time\n"
              << "  p = pause/resume, r = restart, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    blockfall::controller::CommandLineOptions options;
    try {
        options = blockfall::controller::parseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "blockfall: " << e.what() << '\n'
                  << blockfall::controller::usage(argv[0]);
        return 1;
    }
    if (options.showHelp) {
        std::cout << blockfall::controller::usage(argv[0]);
        return 0;
    }

    GameState game{options.config};
    GameController controller{game};

    std::string cmd;
    printGame(game, controller);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'a': case 'A':
            controller.handleAction(InputAction::MoveLeft);
            break;
        case 'd': case 'D':
            controller.handleAction(InputAction::MoveRight);
            break;
        case 's': case 'S':
            controller.handleAction(InputAction::SoftDrop);
            break;
        case 'w': case 'W':
        case 'x': case 'X':
            controller.handleAction(InputAction::RotateCW);
            break;
        case 'z': case 'Z':
            controller.handleAction(InputAction::RotateCCW);
            break;
        case 'h': case 'H':
            controller.handleAction(InputAction::HardDrop);
            break;
        case 'c': case 'C':
            controller.handleAction(InputAction::Hold);
            break;
        case 'g': case 'G':
            // The drop interval is bounded by GameConfig::validate
            if (auto interval = GameController::durationFromSeconds(game.config().dropIntervalSeconds)) {
                controller.update(*interval);
            }
            break;
        case 't': case 'T': {
            std::istringstream in(cmd.substr(1));
            double seconds = 0.0;
            std::optional<GameController::Duration> step;
            if (in >> seconds) {
                step = GameController::durationFromSeconds(seconds);
            }
            if (!step) {
                std::cout << "Usage: t <seconds>, with 0 <= seconds <= "
                          << GameController::MaxStepSeconds << '\n';
                break;
            }
            controller.update(*step);
            break;
        }
        case 'p': case 'P':
            controller.handleAction(InputAction::PauseResume);
            break;
        case 'r': case 'R':
            game = GameState{options.config};
            controller.resetTiming();
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printGame(game, controller);

        if (game.isGameOver()) {
            std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
        }
    }

    return 0;
}
