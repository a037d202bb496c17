#include "GridView.hpp"
#include <string>

namespace {

const sf::Color kBackground(255, 255, 255);
const sf::Color kGridLine(200, 200, 200);
const sf::Color kLocalFill(255, 0, 0);
const sf::Color kRemoteFill(0, 0, 255);
const sf::Color kOutline(0, 0, 0);

} // namespace

GridView::GridView(int width, int height, sf::Vector2f origin)
    : m_width(width)
    , m_height(height)
    , m_origin(origin)
{
    buildGridLines();
}

void GridView::buildGridLines() {
    m_gridLines.clear();

    const float w = (float)(m_width * TILE_SIZE);
    const float h = (float)(m_height * TILE_SIZE);

    for (int x = 0; x <= m_width; ++x) {
        const float px = m_origin.x + (float)(x * TILE_SIZE);
        m_gridLines.append(sf::Vertex{ { px, m_origin.y }, kGridLine });
        m_gridLines.append(sf::Vertex{ { px, m_origin.y + h }, kGridLine });
    }
    for (int y = 0; y <= m_height; ++y) {
        const float py = m_origin.y + (float)(y * TILE_SIZE);
        m_gridLines.append(sf::Vertex{ { m_origin.x, py }, kGridLine });
        m_gridLines.append(sf::Vertex{ { m_origin.x + w, py }, kGridLine });
    }
}

void GridView::upsert(game::PlayerId id, const game::Position& pos, bool isLocal) {
    Marker& m = m_markers[id];
    m.pos = pos;
    m.isLocal = isLocal;
}

void GridView::remove(game::PlayerId id) {
    m_markers.erase(id);
}

sf::Vector2f GridView::cellToScreen(float cellX, float cellY) const {
    return { m_origin.x + cellX * TILE_SIZE, m_origin.y + cellY * TILE_SIZE };
}

void GridView::render(sf::RenderTarget& target, const sf::Font* font) const {
    sf::RectangleShape board(pixelSize());
    board.setPosition(m_origin);
    board.setFillColor(kBackground);
    target.draw(board);
    target.draw(m_gridLines);

    const float radius = TILE_SIZE / 2.f;
    sf::CircleShape circle(radius);
    circle.setOutlineColor(kOutline);
    circle.setOutlineThickness(1.f);

    // remote players first so the local marker stays on top
    for (int pass = 0; pass < 2; ++pass) {
        const bool drawLocal = (pass == 1);

        for (const auto& [id, m] : m_markers) {
            if (m.isLocal != drawLocal) continue;

            const sf::Vector2f topLeft = cellToScreen((float)m.pos.x, (float)m.pos.y);
            circle.setPosition(topLeft);
            circle.setFillColor(m.isLocal ? kLocalFill : kRemoteFill);
            target.draw(circle);

            if (font) {
                sf::Text label(*font, m.isLocal ? std::string("Me") : std::to_string(id), 12);
                label.setFillColor(sf::Color::White);
                label.setPosition({ topLeft.x + TILE_SIZE / 4.f, topLeft.y + TILE_SIZE / 4.f });
                target.draw(label);
            }
        }
    }
}
