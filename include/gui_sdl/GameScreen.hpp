#pragma once

#include "gui_sdl/Screen.hpp"
#include "core/GameConfig.hpp"
#include "core/GameSnapshot.hpp"
#include "core/GameState.hpp"
#include "controller/GameController.hpp"

#include <vector>

namespace blockfall::gui_sdl {

class GameScreen final : public Screen {
public:
    explicit GameScreen(const blockfall::core::GameConfig& config);

    void handleEvent(Application& app, const SDL_Event& e) override;
    void update(Application& app, FrameTime elapsed) override;
    void render(Application& app) override;
    void onFocusLost(Application& app) override;

private:
    struct Layout {
        int cell = 30;

        int boardX = 0;
        int boardY = 30;
        int boardW = 0;
        int boardH = 0;

        int sideW = 150; // hold (left) and next (right) columns
    };

    Layout computeLayout(int windowW, int windowH) const;

    void renderBoard(SDL_Renderer* renderer, const blockfall::core::GameSnapshot& snap,
                     const Layout& L) const;
    void renderPreview(const char* title, int x, int y, int w,
                       const std::vector<blockfall::core::TetrominoType>& kinds) const;
    void renderHUD(const blockfall::core::GameSnapshot& snap, const Layout& L);
    void renderOverlayText(const blockfall::core::GameSnapshot& snap, const Layout& L) const;

    void restart();

private:
    blockfall::core::GameConfig config_;
    blockfall::core::GameState gameState_;
    blockfall::controller::GameController controller_;
};

} // namespace blockfall::gui_sdl
