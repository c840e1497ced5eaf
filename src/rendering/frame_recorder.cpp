#include "elastic/rendering/frame_recorder.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

#include "elastic/core/profile.hpp"

FrameRecorder::FrameRecorder(std::string outputDir, const Simulation::Viewport& viewport)
    : outputDir(std::move(outputDir))
    , renderer(viewport)
{
}

bool FrameRecorder::init() {
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "Failed to create output directory " << outputDir
                  << ": " << ec.message() << std::endl;
        return false;
    }

    const auto& viewport = renderer.getViewport();
    if (!texture.create(viewport.widthPixels(), viewport.heightPixels())) {
        std::cerr << "Failed to create " << viewport.widthPixels() << "x"
                  << viewport.heightPixels() << " render texture" << std::endl;
        return false;
    }

    initialized = true;
    return true;
}

bool FrameRecorder::capture(const entt::registry& registry, std::uint64_t index) {
    PROFILE_SCOPE("FrameRecorder::capture");

    if (!initialized) {
        std::cerr << "FrameRecorder::capture called before init()" << std::endl;
        return false;
    }

    renderer.renderScene(texture, registry);
    texture.display();

    std::filesystem::path const path = std::filesystem::path(outputDir) / frameFileName(index);
    sf::Image const image = texture.getTexture().copyToImage();
    if (!image.saveToFile(path.string())) {
        std::cerr << "Failed to write " << path.string() << std::endl;
        return false;
    }

    ++written;
    return true;
}

std::string FrameRecorder::frameFileName(std::uint64_t index) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "frame_%05llu.png",
                  static_cast<unsigned long long>(index));
    return buffer;
}
