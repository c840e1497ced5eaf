/**
 * @file frame_recorder.hpp
 * @brief Offscreen rendering of simulation frames to numbered PNG files
 *
 * Frames are written as frame_00000.png, frame_00001.png, ... into the output
 * directory. At 1/dt frames per second they can be assembled into a video by
 * an external encoder, e.g.
 * `ffmpeg -framerate 100 -i frame_%05d.png balls.mp4`.
 */

#pragma once

#include <cstdint>
#include <string>
#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "elastic/core/viewport.hpp"
#include "elastic/rendering/renderer.hpp"

class FrameRecorder {
public:
    FrameRecorder(std::string outputDir, const Simulation::Viewport& viewport);

    /**
     * @brief Creates the output directory and the offscreen render target
     * @return true if initialization successful, false otherwise
     */
    bool init();

    /**
     * @brief Renders the registry and writes it as frame @p index
     * @return false if the image could not be written
     */
    bool capture(const entt::registry& registry, std::uint64_t index);

    /** @brief File name of frame @p index, e.g. frame_00042.png */
    static std::string frameFileName(std::uint64_t index);

    std::uint64_t framesWritten() const { return written; }
    const std::string& getOutputDir() const { return outputDir; }

private:
    std::string outputDir;
    Renderer renderer;
    sf::RenderTexture texture;
    bool initialized = false;
    std::uint64_t written = 0;
};
