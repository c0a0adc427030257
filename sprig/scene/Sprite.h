// Drawable, animated scene node driven by an ordered list of behaviors.
#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "Behavior.h"
#include "GameObject.h"
#include "../assets/Texture.h"
#include "../math/Rect.h"
#include "../math/Vec2.h"
#include "../render/Color.h"

namespace Sprig {

class Sprite : public GameObject {
public:
    static constexpr float kDefaultFps = 2.0f;

    explicit Sprite(const Vec2& position, std::vector<TexturePtr> images = {}, GameObjectConfig config = {});

    // Appends a behavior; one added while behaviors are running first runs next tick.
    Behavior& addBehavior(BehaviorPtr behavior);

    template <typename T, typename... Args>
    T& emplaceBehavior(Args&&... args) {
        auto behavior = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *behavior;
        addBehavior(std::move(behavior));
        return ref;
    }

    std::size_t behaviorCount() const { return behaviors_.size(); }

    const Vec2& position() const { return position_; }
    void setPosition(const Vec2& position) { position_ = position; }

    // Anchor that ReturnToNormalPosition steers back to; starts at the spawn position.
    const Vec2& normalPosition() const { return normalPosition_; }
    void setNormalPosition(const Vec2& position) { normalPosition_ = position; }

    // Explicit size wins; otherwise the current frame's pixel size is used.
    void setSize(const Vec2& size) { size_ = size; }
    Vec2 size() const;
    Rect bounds() const { return Rect::fromCenter(position_, size()); }

    // Fill used when the sprite has no images.
    void setColour(const Color& colour) { colour_ = colour; }
    const Color& colour() const { return colour_; }

    const std::vector<TexturePtr>& images() const { return images_; }
    void setImages(std::vector<TexturePtr> images);
    TexturePtr currentImage() const;
    int frame() const { return frame_; }
    float fps() const { return fps_; }
    void setFps(float fps) { fps_ = fps; }

    // Seconds left before the sprite destroys itself; nullopt means no limit.
    const std::optional<float>& lifetime() const { return lifetime_; }
    void setLifetime(std::optional<float> seconds) { lifetime_ = seconds; }

protected:
    void onUpdate(float dt) override;
    void onDraw(RenderDevice& surface) override;
    void onActivated() override;

private:
    void animate(float dt);
    void runBehaviors(float dt);

    Vec2 position_{};
    Vec2 normalPosition_{};
    Vec2 size_{};
    Color colour_{255, 255, 255, 255};
    std::vector<TexturePtr> images_;
    int frame_{0};
    float fps_{kDefaultFps};
    float frameAccumulator_{0.0f};
    std::optional<float> lifetime_{};
    std::vector<BehaviorPtr> behaviors_;
};

using SpritePtr = std::shared_ptr<Sprite>;

}  // namespace Sprig
