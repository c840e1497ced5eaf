#include "elastic/rendering/renderer.hpp"

#include <algorithm>

namespace {
    const sf::Color BackgroundColor = sf::Color::White;
    const sf::Color BoundaryColor = sf::Color::Black;
    constexpr float BoundaryThickness = 2.0f;
}

Renderer::Renderer(const Simulation::Viewport& viewport)
    : viewport(viewport)
{
}

sf::Color Renderer::toSfColor(const Components::Color& color) {
    return sf::Color(color.r, color.g, color.b);
}

void Renderer::renderScene(sf::RenderTarget& target, const entt::registry& registry) const {
    target.clear(BackgroundColor);
    renderBoundary(target);
    renderBodies(target, registry);
}

void Renderer::renderBoundary(sf::RenderTarget& target) const {
    // Simulation (0, height) is the top-left corner on screen
    float const left = static_cast<float>(viewport.toScreenX(0.0));
    float const top = static_cast<float>(viewport.toScreenY(viewport.getBoundaryHeight()));
    float const width = static_cast<float>(viewport.metersToPixels(viewport.getBoundaryWidth()));
    float const height = static_cast<float>(viewport.metersToPixels(viewport.getBoundaryHeight()));

    sf::RectangleShape rect(sf::Vector2f(width, height));
    rect.setPosition(left, top);
    rect.setFillColor(sf::Color::Transparent);
    rect.setOutlineColor(BoundaryColor);
    // Negative thickness keeps the outline inside the rectangle
    rect.setOutlineThickness(-BoundaryThickness);
    target.draw(rect);
}

void Renderer::renderBodies(sf::RenderTarget& target, const entt::registry& registry) const {
    auto view = registry.view<const Components::Position, const Components::Radius>();
    for (auto entity : view) {
        const auto& pos = view.get<const Components::Position>(entity);
        const auto& radius = view.get<const Components::Radius>(entity);

        float const px = static_cast<float>(viewport.toScreenX(pos.x));
        float const py = static_cast<float>(viewport.toScreenY(pos.y));
        float const radiusPixels = static_cast<float>(std::max(1.0, viewport.metersToPixels(radius.value)));

        sf::Color fillColor = sf::Color::Blue;
        if (const auto* colComp = registry.try_get<Components::Color>(entity)) {
            fillColor = toSfColor(*colComp);
        }

        sf::CircleShape circle(radiusPixels);
        circle.setOrigin(radiusPixels, radiusPixels);
        circle.setPosition(px, py);
        circle.setFillColor(fillColor);
        target.draw(circle);
    }
}
