#include "Control.h"

namespace Sprig::Behaviors {

Sequence::Sequence(std::vector<BehaviorPtr> behaviors) : behaviors_(std::move(behaviors)) {}

bool Sequence::enabled(Sprite& sprite) {
    if (behaviors_.empty()) {
        return false;
    }
    while (index_ + 1 < behaviors_.size() && !behaviors_[index_]->enabled(sprite)) {
        ++index_;
    }
    return behaviors_[index_]->enabled(sprite);
}

void Sequence::execute(float dt, Sprite& sprite) {
    if (behaviors_.empty()) {
        return;
    }
    behaviors_[index_]->execute(dt, sprite);
}

void Whilst::execute(float dt, Sprite& sprite) {
    primary_->execute(dt, sprite);
    secondary_->execute(dt, sprite);
}

void Exactly::execute(float dt, Sprite& sprite) {
    --remaining_;
    inner_->execute(dt, sprite);
}

void Callback::execute(float dt, Sprite& sprite) {
    if (fn_) {
        fn_(dt, sprite);
    }
}

}  // namespace Sprig::Behaviors
