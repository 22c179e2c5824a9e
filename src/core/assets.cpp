#include "pong/core/assets.hpp"

#include <fstream>

namespace Assets {

std::string findFirstReadable(const std::vector<std::string>& candidates) {
    for (const auto& path : candidates) {
        std::ifstream file(path, std::ios::binary);
        if (file.good()) {
            return path;
        }
    }
    return {};
}

} // namespace Assets
