/**
 * @file renderer.hpp
 * @brief Scene drawing using SFML
 *
 * This system handles:
 * - The boundary outline
 * - One filled circle per body, in the body's Color component
 *
 * Draws to any sf::RenderTarget, so the same code serves the interactive
 * window and offscreen frame capture.
 */

#ifndef ELASTIC_RENDERER_HPP
#define ELASTIC_RENDERER_HPP

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "elastic/components/basic.hpp"
#include "elastic/core/viewport.hpp"

class Renderer {
public:
    /**
     * @brief Constructs a renderer for the given viewport
     */
    explicit Renderer(const Simulation::Viewport& viewport);

    /**
     * @brief Clears @p target and draws the boundary and all bodies
     * @param target Window or render texture sized to the viewport
     * @param registry EnTT registry containing body entities
     */
    void renderScene(sf::RenderTarget& target, const entt::registry& registry) const;

    /**
     * @brief Replaces the viewport, e.g. after a scenario change
     */
    void setViewport(const Simulation::Viewport& newViewport) { viewport = newViewport; }
    const Simulation::Viewport& getViewport() const { return viewport; }

    /** @brief Converts a body colour to an SFML colour */
    static sf::Color toSfColor(const Components::Color& color);

private:
    void renderBoundary(sf::RenderTarget& target) const;
    void renderBodies(sf::RenderTarget& target, const entt::registry& registry) const;

    Simulation::Viewport viewport;
};

#endif
