#include "gui_sdl/GameScreen.hpp"

#include <algorithm>
#include <cfloat>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"
#include "controller/InputAction.hpp"
#include "core/ShapeCatalog.hpp"
#include "core/Types.hpp"

namespace blockfall::gui_sdl {

using blockfall::controller::InputAction;
using blockfall::core::Color;
using blockfall::core::GameSnapshot;
using blockfall::core::ShapeCatalog;
using blockfall::core::TetrominoType;

static ImU32 toImColor(const Color& c, std::uint8_t alpha = 255)
{
    return IM_COL32(c.r, c.g, c.b, alpha);
}

static void fillCell(SDL_Renderer* renderer, int x, int y, int cellSize, const Color& c)
{
    SDL_Rect rect{x, y, cellSize, cellSize};
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, 255);
    SDL_RenderFillRect(renderer, &rect);
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    SDL_RenderDrawRect(renderer, &rect);
}

GameScreen::GameScreen(const blockfall::core::GameConfig& config)
    : config_(config)
    , gameState_(config_)
    , controller_(gameState_)
{
}

void GameScreen::restart()
{
    gameState_ = blockfall::core::GameState{config_};
    controller_.resetTiming();
}

GameScreen::Layout GameScreen::computeLayout(int windowW, int windowH) const
{
    Layout L{};
    const int rows = gameState_.board().rows();
    const int cols = gameState_.board().cols();

    const int margin = 20;
    const int usableW = windowW - margin * 4 - L.sideW * 2;
    const int usableH = windowH - margin * 2;

    int cell = std::min(usableW / std::max(cols, 1), usableH / std::max(rows, 1));
    L.cell = std::clamp(cell, 12, 40);

    L.boardW = cols * L.cell;
    L.boardH = rows * L.cell;
    L.boardX = std::max(margin + L.sideW + margin, (windowW - L.boardW) / 2);
    L.boardY = std::max(margin, (windowH - L.boardH) / 2);
    return L;
}

void GameScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type != SDL_KEYDOWN) return;

    // Keyboard repeat is only honoured for sideways moves and soft drop
    const bool repeat = e.key.repeat != 0;

    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
            controller_.handleAction(InputAction::MoveLeft);
            break;
        case SDLK_RIGHT:
            controller_.handleAction(InputAction::MoveRight);
            break;
        case SDLK_DOWN:
            controller_.handleAction(InputAction::SoftDrop);
            break;
        case SDLK_UP:
            if (!repeat) controller_.handleAction(InputAction::HardDrop);
            break;
        case SDLK_SPACE:
            if (!repeat) controller_.handleAction(InputAction::Hold);
            break;
        case SDLK_z:
            if (!repeat) controller_.handleAction(InputAction::RotateCCW);
            break;
        case SDLK_x:
            if (!repeat) controller_.handleAction(InputAction::RotateCW);
            break;
        case SDLK_p:
        case SDLK_ESCAPE:
            if (!repeat) controller_.handleAction(InputAction::PauseResume);
            break;
        case SDLK_r:
            if (!repeat) restart();
            break;
        case SDLK_q:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void GameScreen::update(Application&, FrameTime elapsed)
{
    controller_.update(elapsed);
}

void GameScreen::onFocusLost(Application&)
{
    if (!controller_.isPaused() && !gameState_.isGameOver()) {
        controller_.handleAction(InputAction::PauseResume);
    }
}

void GameScreen::render(Application& app)
{
    int winW = 0, winH = 0;
    app.getWindowSize(winW, winH);

    const Layout L = computeLayout(winW, winH);
    const GameSnapshot snap = gameState_.snapshot(2);

    renderBoard(app.renderer(), snap, L);

    const int previewW = L.sideW;
    std::vector<TetrominoType> held;
    if (snap.held) held.push_back(*snap.held);
    renderPreview("HOLD", L.boardX - previewW - 20, L.boardY, previewW, held);
    renderPreview("NEXT", L.boardX + L.boardW + 20, L.boardY, previewW, snap.next);

    renderHUD(snap, L);
    renderOverlayText(snap, L);
}

void GameScreen::renderBoard(SDL_Renderer* renderer, const GameSnapshot& snap, const Layout& L) const
{
    const int x = L.boardX;
    const int y = L.boardY;
    const int cellSize = L.cell;

    // Faint grid lines
    SDL_SetRenderDrawColor(renderer, 40, 40, 40, 255);
    for (int r = 0; r < snap.rows; ++r) {
        for (int c = 0; c < snap.cols; ++c) {
            SDL_Rect rect{x + c * cellSize, y + r * cellSize, cellSize, cellSize};
            SDL_RenderDrawRect(renderer, &rect);
        }
    }

    for (int r = 0; r < snap.rows; ++r) {
        for (int c = 0; c < snap.cols; ++c) {
            if (const auto& color = snap.cellAt(r, c)) {
                fillCell(renderer, x + c * cellSize, y + r * cellSize, cellSize, *color);
            }
        }
    }

    if (snap.ghost) {
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, 70);
        for (const auto& b : snap.ghost->cells) {
            if (b.row < 0) continue;
            SDL_Rect rct{x + b.col * cellSize + 2, y + b.row * cellSize + 2, cellSize - 4, cellSize - 4};
            SDL_RenderDrawRect(renderer, &rct);
        }
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }

    if (snap.active) {
        for (const auto& b : snap.active->cells) {
            if (b.row < 0) continue; // only draw the visible part
            fillCell(renderer, x + b.col * cellSize, y + b.row * cellSize, cellSize, snap.active->color);
        }
    }

    if (controller_.isPaused() || snap.gameOver) {
        SDL_Rect boardRect{x, y, L.boardW, L.boardH};
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 160);
        SDL_RenderFillRect(renderer, &boardRect);
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
    }
}

void GameScreen::renderPreview(const char* title, int x, int y, int w,
                               const std::vector<TetrominoType>& kinds) const
{
    const float slot = 80.0f;
    const float h = 40.0f + slot * static_cast<float>(std::max<std::size_t>(kinds.size(), 1));

    ImGui::SetNextWindowPos(ImVec2((float)x, (float)y), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)w, h), ImGuiCond_Always);
    ImGui::Begin(title, nullptr,
                 ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove);

    ImDrawList* dl = ImGui::GetWindowDrawList();
    const ImVec2 wp = ImGui::GetWindowPos();
    const float cell = 15.0f; // half-size blocks

    for (std::size_t i = 0; i < kinds.size(); ++i) {
        // Previews always show the spawn rotation
        const auto& offsets = ShapeCatalog::offsets(kinds[i], blockfall::core::Rotation::R0);
        int minR = offsets[0].row, minC = offsets[0].col;
        for (const auto& o : offsets) {
            minR = std::min(minR, o.row);
            minC = std::min(minC, o.col);
        }

        const ImU32 col = toImColor(ShapeCatalog::color(kinds[i]));
        const float ox = wp.x + 20.0f;
        const float oy = wp.y + 35.0f + slot * static_cast<float>(i);
        for (const auto& o : offsets) {
            const float bx = ox + (o.col - minC) * cell;
            const float by = oy + (o.row - minR) * cell;
            dl->AddRectFilled(ImVec2(bx, by), ImVec2(bx + cell, by + cell), col);
            dl->AddRect(ImVec2(bx, by), ImVec2(bx + cell, by + cell), IM_COL32(255, 255, 255, 255));
        }
    }

    ImGui::Dummy(ImVec2(0, h - 40.0f));
    ImGui::End();
}

void GameScreen::renderHUD(const GameSnapshot& snap, const Layout& L)
{
    ImGui::SetNextWindowPos(ImVec2((float)(L.boardX - L.sideW - 20), (float)(L.boardY + 140)),
                            ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)L.sideW, 0.0f), ImVec2((float)L.sideW, 400.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Lines: %llu", (unsigned long long)snap.linesCleared);
    ImGui::Text("Pieces: %llu", (unsigned long long)snap.lockedPieces);
    ImGui::Text("Time: %.1fs", snap.elapsedSeconds);

    ImGui::Separator();

    if (snap.gameOver) {
        ImGui::TextColored(ImVec4(1.0f, 0.25f, 0.25f, 1.0f), "Game Over");
        if (ImGui::Button("Restart", ImVec2(-1, 0))) {
            restart();
        }
    } else if (controller_.isPaused()) {
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Paused");
    } else {
        ImGui::TextUnformatted("Running");
    }

    ImGui::Separator();
    if (ImGui::CollapsingHeader("Controls")) {
        ImGui::TextUnformatted("Left/Right: Move");
        ImGui::TextUnformatted("Down: Soft drop");
        ImGui::TextUnformatted("Up: Hard drop");
        ImGui::TextUnformatted("Space: Hold");
        ImGui::TextUnformatted("Z / X: Rotate");
        ImGui::TextUnformatted("P/Esc: Pause");
        ImGui::TextUnformatted("R: Restart");
    }

    ImGui::End();
}

void GameScreen::renderOverlayText(const GameSnapshot& snap, const Layout& L) const
{
    const bool paused = controller_.isPaused();
    if (!paused && !snap.gameOver) return;

    const char* msg = snap.gameOver ? "GAME OVER" : "PAUSED";
    const char* hint = snap.gameOver ? "Press R to restart" : "Press P or ESC to resume";

    ImDrawList* dl = ImGui::GetForegroundDrawList();

    const float cx = L.boardX + L.boardW * 0.5f;
    const float cy = L.boardY + L.boardH * 0.5f;
    const float cardW = std::min(320.0f, L.boardW * 0.9f);
    const float cardH = 90.0f;

    dl->AddRectFilled(ImVec2(cx - cardW * 0.5f, cy - cardH * 0.5f),
                      ImVec2(cx + cardW * 0.5f, cy + cardH * 0.5f),
                      IM_COL32(0, 0, 0, 175), 10.0f);

    ImFont* font = ImGui::GetFont();
    const float bigSize = ImGui::GetFontSize() * 2.0f;
    const ImVec2 tSize = font->CalcTextSizeA(bigSize, FLT_MAX, 0.0f, msg);
    dl->AddText(font, bigSize, ImVec2(cx - tSize.x * 0.5f, cy - 30.0f),
                IM_COL32(255, 255, 255, 255), msg);

    const ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + 14.0f), IM_COL32(220, 220, 220, 255), hint);
}

} // namespace blockfall::gui_sdl
