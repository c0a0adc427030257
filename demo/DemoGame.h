// Small invaders-style scene built on the Sprig engine.
#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../sprig/assets/AssetManifest.h"
#include "../sprig/assets/TextureManager.h"
#include "../sprig/core/ApplicationListener.h"
#include "../sprig/platform/Window.h"
#include "../sprig/render/BlockTextRenderer.h"
#include "../sprig/scene/GameObject.h"
#include "../sprig/scene/Sprite.h"
#include "../sprig/scene/SpriteCollisions.h"

namespace Demo {

struct DemoSettings {
    int alienColumns{8};
    int alienRows{3};
    float alienSpacing{48.0f};
    float marchDistance{120.0f};
    float marchSpeed{40.0f};
    float dropDistance{16.0f};
    float playerSpeed{220.0f};
    float shotSpeed{360.0f};
    float shotLifetime{2.0f};
    int pointsPerAlien{10};
};

class DemoGame final : public Sprig::ApplicationListener {
public:
    explicit DemoGame(DemoSettings settings = {}, std::optional<Sprig::AssetManifest> manifest = std::nullopt);

    bool onInitialize(Sprig::Application& app) override;
    void onShutdown() override;

    int score() const { return score_; }

private:
    void spawnPlayer(Sprig::Application& app);
    void spawnAliens();
    void fireShot();
    void onShotHitsAlien(Sprig::Sprite& shot, Sprig::Sprite& alien);
    void showScore();
    std::vector<Sprig::TexturePtr> framesFor(const std::string& name);

    DemoSettings settings_;
    std::optional<Sprig::AssetManifest> manifest_;
    std::unique_ptr<Sprig::TextureManager> textures_;
    std::unique_ptr<Sprig::BlockTextRenderer> text_;
    Sprig::Window* window_{nullptr};
    std::string titleBase_;
    float spriteFps_{Sprig::Sprite::kDefaultFps};
    Sprig::Vec2 screen_{};
    std::mt19937 rng_{std::random_device{}()};
    int score_{0};

    std::shared_ptr<Sprig::Sprite> player_;
    std::shared_ptr<Sprig::GameObject> aliens_;
    std::shared_ptr<Sprig::GameObject> shots_;
    std::shared_ptr<Sprig::GameObject> effects_;
    std::shared_ptr<Sprig::SpriteCollisions> collisions_;
};

}  // namespace Demo
