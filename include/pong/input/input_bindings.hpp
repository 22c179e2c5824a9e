/**
 * @file input_bindings.hpp
 * @brief Keyboard to input-axis mapping
 */
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <SFML/Window/Keyboard.hpp>

/**
 * @class InputBindings
 * @brief Maps action names to a pair of keys forming one axis.
 *
 * Holding the "up" key yields +1, the "down" key -1, both or neither 0.
 */
class InputBindings {
public:
    struct AxisBinding {
        std::string action;
        sf::Keyboard::Key up;
        sf::Keyboard::Key down;
    };

    /** @brief W/S for the left paddle, Up/Down for the right paddle. */
    static InputBindings defaults();

    void bindAxis(const std::string& action, sf::Keyboard::Key up, sf::Keyboard::Key down);

    /** @brief Samples every bound axis from the live keyboard state. */
    std::unordered_map<std::string, float> sampleKeyboard() const;

private:
    std::vector<AxisBinding> axes;
};
