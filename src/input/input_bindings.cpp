#include "pong/input/input_bindings.hpp"

#include <algorithm>

#include "pong/core/constants.hpp"
#include "pong/input/axis.hpp"

InputBindings InputBindings::defaults() {
    InputBindings bindings;
    bindings.bindAxis(PongConstants::LeftPaddleAction, sf::Keyboard::W, sf::Keyboard::S);
    bindings.bindAxis(PongConstants::RightPaddleAction, sf::Keyboard::Up, sf::Keyboard::Down);
    return bindings;
}

void InputBindings::bindAxis(const std::string& action, sf::Keyboard::Key up, sf::Keyboard::Key down) {
    auto it = std::find_if(axes.begin(), axes.end(),
                           [&](const AxisBinding& b) { return b.action == action; });
    if (it != axes.end()) {
        it->up = up;
        it->down = down;
        return;
    }
    axes.push_back(AxisBinding{action, up, down});
}

std::unordered_map<std::string, float> InputBindings::sampleKeyboard() const {
    std::unordered_map<std::string, float> values;
    for (const auto& binding : axes) {
        values[binding.action] = Input::axisFromKeys(sf::Keyboard::isKeyPressed(binding.up),
                                                    sf::Keyboard::isKeyPressed(binding.down));
    }
    return values;
}
