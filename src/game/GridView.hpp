#pragma once
#include <SFML/Graphics.hpp>
#include <unordered_map>

#include "PlayerView.hpp"

// Flat tile grid with one circle marker per player.
class GridView : public PlayerView {
public:
    static constexpr int TILE_SIZE = 30; // pixels, rendering only

    struct Marker {
        game::Position pos{};
        bool isLocal{ false };
    };

public:
    GridView(int width, int height, sf::Vector2f origin = { 0.f, 0.f });

    // PlayerView
    void upsert(game::PlayerId id, const game::Position& pos, bool isLocal) override;
    void remove(game::PlayerId id) override;

    // Rendering. font may be null (markers without labels).
    void render(sf::RenderTarget& target, const sf::Font* font) const;

    // Coordinate conversion
    sf::Vector2f cellToScreen(float cellX, float cellY) const;

    sf::Vector2f pixelSize() const { return { (float)(m_width * TILE_SIZE), (float)(m_height * TILE_SIZE) }; }

private:
    void buildGridLines();

private:
    int m_width{ 0 };
    int m_height{ 0 };
    sf::Vector2f m_origin{};

    sf::VertexArray m_gridLines{ sf::PrimitiveType::Lines };
    std::unordered_map<game::PlayerId, Marker> m_markers;
};
