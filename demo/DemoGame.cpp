#include "DemoGame.h"

#include <algorithm>

#include "particles/ParticleExplosion.h"
#include "particles/ParticleScore.h"
#include "../sprig/behaviors/Control.h"
#include "../sprig/behaviors/Motion.h"
#include "../sprig/core/Application.h"
#include "../sprig/core/Logger.h"

namespace Demo {

using namespace Sprig::Behaviors;

namespace {
std::shared_ptr<Sprig::GameObject> makeGroup(const std::string& name) {
    Sprig::GameObjectConfig config;
    config.name = name;
    return std::make_shared<Sprig::GameObject>(std::move(config));
}

bool anyAlive(const Sprig::GameObject& group) {
    const auto& children = group.children();
    return std::any_of(children.begin(), children.end(), [](const auto& c) { return !c->destroyed(); });
}
}  // namespace

DemoGame::DemoGame(DemoSettings settings, std::optional<Sprig::AssetManifest> manifest)
    : settings_(settings), manifest_(std::move(manifest)) {}

bool DemoGame::onInitialize(Sprig::Application& app) {
    const auto& window = app.config().window;
    screen_ = Sprig::Vec2{static_cast<float>(window.width), static_cast<float>(window.height)};
    spriteFps_ = app.config().spriteFps;
    titleBase_ = window.title;
    if (manifest_) {
        textures_ = std::make_unique<Sprig::TextureManager>(app.renderer(), manifest_->baseDir);
    }
    text_ = std::make_unique<Sprig::BlockTextRenderer>(app.renderer());
    window_ = &app.window();

    auto& root = app.root();
    aliens_ = makeGroup("aliens");
    shots_ = makeGroup("shots");
    effects_ = makeGroup("effects");
    root.addChild(aliens_);
    root.addChild(shots_);
    root.addChild(effects_);

    spawnPlayer(app);
    spawnAliens();

    Sprig::GameObjectConfig collisionConfig;
    collisionConfig.name = "collisions";
    collisions_ = root.emplaceChild<Sprig::SpriteCollisions>(std::move(collisionConfig));
    collisions_->addDetection(Sprig::SpriteCollisions::childrenOf(shots_),
                              Sprig::SpriteCollisions::childrenOf(aliens_),
                              [this](Sprig::Sprite& shot, Sprig::Sprite& alien) { onShotHitsAlien(shot, alien); });

    const Sprig::InputState& input = app.input();
    root.addUpdateFunc([this, &input](float /*dt*/) {
        if (input.wasPressed(Sprig::InputKey::Fire)) {
            fireShot();
        }
        if (input.wasPressed(Sprig::InputKey::Pause)) {
            aliens_->setActive(!aliens_->active());
        }
        if (!anyAlive(*aliens_)) {
            Sprig::logInfo("Wave cleared; score " + std::to_string(score_));
            spawnAliens();
        }
    });

    root.addDrawFunc([this](Sprig::RenderDevice&) {
        text_->drawText(std::to_string(score_), Sprig::Vec2{screen_.x * 0.5f, 16.0f}, 2.0f,
                        Sprig::Color{230, 230, 230, 255});
    });
    showScore();

    Sprig::logInfo("Demo scene ready.");
    return true;
}

void DemoGame::onShutdown() { Sprig::logInfo("Demo finished with score " + std::to_string(score_)); }

std::vector<Sprig::TexturePtr> DemoGame::framesFor(const std::string& name) {
    if (!manifest_ || !textures_) {
        return {};
    }
    const auto* paths = manifest_->framesFor(name);
    return paths ? textures_->getOrLoadAll(*paths) : std::vector<Sprig::TexturePtr>{};
}

void DemoGame::spawnPlayer(Sprig::Application& app) {
    Sprig::GameObjectConfig config;
    config.name = "player";
    player_ = std::make_shared<Sprig::Sprite>(Sprig::Vec2{screen_.x * 0.5f, screen_.y - 40.0f}, framesFor("player"),
                                              std::move(config));
    player_->setSize(Sprig::Vec2{32.0f, 16.0f});
    player_->setColour(Sprig::Color{80, 220, 120, 255});
    player_->setFps(spriteFps_);
    player_->emplaceBehavior<MovePlayer>(app.input(), settings_.playerSpeed, 20.0f, screen_.x - 20.0f);
    app.root().addChild(player_);
}

void DemoGame::spawnAliens() {
    const float width = static_cast<float>(settings_.alienColumns - 1) * settings_.alienSpacing;
    const float left = (screen_.x - width - settings_.marchDistance) * 0.5f;
    const auto frames = framesFor("alien");

    for (int row = 0; row < settings_.alienRows; ++row) {
        for (int col = 0; col < settings_.alienColumns; ++col) {
            const Sprig::Vec2 pos{left + static_cast<float>(col) * settings_.alienSpacing,
                                  60.0f + static_cast<float>(row) * settings_.alienSpacing};
            auto alien = std::make_shared<Sprig::Sprite>(pos, frames);
            alien->setSize(Sprig::Vec2{28.0f, 20.0f});
            alien->setColour(Sprig::Color{200, 80, 220, 255});
            alien->setFps(spriteFps_);

            // Each lap of the march is one removable sequence; a new lap starts when it ends.
            const DemoSettings s = settings_;
            alien->addUpdateHandler([s](Sprig::GameObject& self, float /*dt*/) {
                auto& sprite = static_cast<Sprig::Sprite&>(self);
                if (sprite.behaviorCount() > 0) {
                    return;
                }
                sprite.addBehavior(std::make_unique<RemoveWhenFinished>(Sequence::of(
                    std::make_unique<Move>(Sprig::Vec2{s.marchDistance, 0.0f}, Sprig::Vec2{s.marchSpeed, 0.0f}),
                    std::make_unique<Move>(Sprig::Vec2{0.0f, s.dropDistance}, Sprig::Vec2{0.0f, s.marchSpeed}),
                    std::make_unique<Move>(Sprig::Vec2{-s.marchDistance, 0.0f}, Sprig::Vec2{s.marchSpeed, 0.0f}),
                    std::make_unique<Move>(Sprig::Vec2{0.0f, s.dropDistance}, Sprig::Vec2{0.0f, s.marchSpeed}))));
            });
            aliens_->addChild(alien);
        }
    }
}

void DemoGame::fireShot() {
    if (!player_ || player_->destroyed()) {
        return;
    }
    auto shot = std::make_shared<Sprig::Sprite>(player_->position() + Sprig::Vec2{0.0f, -12.0f}, framesFor("shot"));
    shot->setSize(Sprig::Vec2{4.0f, 10.0f});
    shot->setColour(Sprig::Color{255, 255, 255, 255});
    shot->setLifetime(settings_.shotLifetime);

    // Cools from white to yellow as it climbs.
    shot->addBehavior(std::make_unique<RemoveWhenFinished>(std::make_unique<Whilst>(
        std::make_unique<Move>(Sprig::Vec2{0.0f, -screen_.y}, Sprig::Vec2{0.0f, settings_.shotSpeed}),
        std::make_unique<Callback>([](float dt, Sprig::Sprite& sprite) {
            Sprig::Color c = sprite.colour();
            c.b = static_cast<unsigned char>(std::max(0.0f, static_cast<float>(c.b) - 255.0f * dt));
            sprite.setColour(c);
        }))));
    // Flicker for the first few frames while the shot leaves the ship, then stay visible.
    shot->addBehavior(std::make_unique<RemoveWhenFinished>(Sequence::of(
        std::make_unique<Exactly>(6, std::make_unique<Callback>([](float /*dt*/, Sprig::Sprite& sprite) {
            sprite.setVisible(!sprite.visible());
        })),
        std::make_unique<Exactly>(1, std::make_unique<Callback>([](float /*dt*/, Sprig::Sprite& sprite) {
            sprite.setVisible(true);
        })))));
    shots_->addChild(shot);
}

void DemoGame::onShotHitsAlien(Sprig::Sprite& shot, Sprig::Sprite& alien) {
    shot.destroy();
    alien.destroy();
    score_ += settings_.pointsPerAlien;

    effects_->emplaceChild<ParticleExplosion>(alien.position(), 1.0f, Sprig::Color{255, 160, 40, 255}, 24, rng_);
    effects_->emplaceChild<ParticleScore>(alien.position(), 1.0f, settings_.pointsPerAlien, rng_, text_.get());
    showScore();
}

void DemoGame::showScore() {
    if (window_) {
        window_->setTitle(titleBase_ + " - score " + std::to_string(score_));
    }
}

}  // namespace Demo
