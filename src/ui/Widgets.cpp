#include "Widgets.hpp"
#include <sstream>

namespace {

const sf::Vector2f kDialogSize{ 600.f, 240.f };
const sf::Vector2f kOkSize{ 120.f, 40.f };

sf::Vector2f dialogPos(sf::Vector2u win) {
    return { (win.x - kDialogSize.x) / 2.f, (win.y - kDialogSize.y) / 2.f };
}

sf::Vector2f okPos(sf::Vector2u win) {
    const sf::Vector2f d = dialogPos(win);
    return { d.x + (kDialogSize.x - kOkSize.x) / 2.f, d.y + kDialogSize.y - kOkSize.y - 20.f };
}

// Greedy word wrap by character count.
std::string wrap(const std::string& text, size_t width) {
    std::istringstream in(text);
    std::string word, line, out;
    while (in >> word) {
        if (!line.empty() && line.size() + 1 + word.size() > width) {
            out += line + "\n";
            line.clear();
        }
        if (!line.empty()) line += ' ';
        line += word;
    }
    out += line;
    return out;
}

} // namespace

sf::Text makeText(const sf::Font& font, const std::string& s, unsigned size, sf::Vector2f pos, sf::Color color) {
    sf::Text t(font, s, size);
    t.setPosition(pos);
    t.setFillColor(color);
    return t;
}

// -----------------------------------------------------------------------------

Button::Button(std::string label, sf::Vector2f pos, sf::Vector2f size)
    : m_label(std::move(label))
    , m_box(size)
{
    m_box.setPosition(pos);
    m_box.setOutlineThickness(2.f);
    m_box.setOutlineColor(sf::Color(220, 220, 255));
}

void Button::draw(sf::RenderTarget& target, const sf::Font* font, bool hovered) const {
    sf::RectangleShape box = m_box;
    box.setFillColor(hovered ? sf::Color(35, 90, 55) : sf::Color(25, 70, 35));
    target.draw(box);

    if (!font) return;
    sf::Text t(*font, m_label, 18);
    const sf::FloatRect tb = t.getLocalBounds();
    const sf::Vector2f pos = m_box.getPosition();
    const sf::Vector2f size = m_box.getSize();
    t.setPosition({ pos.x + (size.x - tb.size.x) / 2.f - tb.position.x,
                    pos.y + (size.y - tb.size.y) / 2.f - tb.position.y });
    target.draw(t);
}

// -----------------------------------------------------------------------------

TextField::TextField(std::string placeholder, sf::Vector2f pos, float width, bool masked)
    : m_placeholder(std::move(placeholder))
    , m_masked(masked)
    , m_box({ width, 36.f })
{
    m_box.setPosition(pos);
    m_box.setFillColor(sf::Color(30, 30, 38));
}

void TextField::setText(std::string text) {
    if (text.size() > kMaxLength) text.resize(kMaxLength);
    m_text = std::move(text);
}

void TextField::handleText(char32_t unicode) {
    if (unicode == U'\b') {
        if (!m_text.empty()) m_text.pop_back();
        return;
    }
    if (unicode < 32 || unicode > 126) return;
    if (m_text.size() >= kMaxLength) return;
    m_text.push_back(static_cast<char>(unicode));
}

void TextField::draw(sf::RenderTarget& target, const sf::Font* font) const {
    sf::RectangleShape box = m_box;
    box.setOutlineThickness(2.f);
    box.setOutlineColor(m_focused ? sf::Color(220, 220, 255) : sf::Color(90, 90, 95));
    target.draw(box);

    if (!font) return;

    const sf::Vector2f pos = m_box.getPosition();
    if (m_text.empty() && !m_focused) {
        target.draw(makeText(*font, m_placeholder, 16, { pos.x + 10.f, pos.y + 8.f }, sf::Color(120, 120, 130)));
        return;
    }

    std::string shown = m_masked ? std::string(m_text.size(), '*') : m_text;
    if (m_focused) shown += '_';
    target.draw(makeText(*font, shown, 16, { pos.x + 10.f, pos.y + 8.f }));
}

// -----------------------------------------------------------------------------

MessageDialog::MessageDialog(sf::Vector2u windowSize)
    : m_overlay({ (float)windowSize.x, (float)windowSize.y })
    , m_box(kDialogSize)
    , m_okButton("OK", okPos(windowSize), kOkSize)
{
    m_overlay.setFillColor(sf::Color(0, 0, 0, 180));

    m_box.setPosition(dialogPos(windowSize));
    m_box.setFillColor(sf::Color(40, 40, 50));
    m_box.setOutlineColor(sf::Color(100, 100, 120));
    m_box.setOutlineThickness(3.f);
}

void MessageDialog::show(Kind kind, std::string title, std::string message) {
    m_kind = kind;
    m_title = std::move(title);
    m_message = wrap(message, 60);
    m_visible = true;
}

bool MessageDialog::handleEvent(const sf::Event& ev, const sf::RenderWindow& window) {
    if (!m_visible) return false;
    if (ev.is<sf::Event::Closed>()) return false;

    if (const auto* kp = ev.getIf<sf::Event::KeyPressed>()) {
        if (kp->code == sf::Keyboard::Key::Enter || kp->code == sf::Keyboard::Key::Escape) {
            dismiss();
        }
        return true;
    }

    if (const auto* mb = ev.getIf<sf::Event::MouseButtonPressed>()) {
        if (mb->button == sf::Mouse::Button::Left &&
            m_okButton.contains(window.mapPixelToCoords(mb->position))) {
            dismiss();
        }
        return true;
    }

    return true;
}

void MessageDialog::draw(sf::RenderTarget& target, const sf::Font* font) const {
    if (!m_visible) return;

    target.draw(m_overlay);
    target.draw(m_box);
    m_okButton.draw(target, font, false);

    if (!font) return;

    sf::Color titleColor = sf::Color(220, 220, 255);
    if (m_kind == Kind::Warning) titleColor = sf::Color(240, 200, 90);
    if (m_kind == Kind::Error) titleColor = sf::Color(240, 110, 110);

    const sf::Vector2f pos = m_box.getPosition();
    target.draw(makeText(*font, m_title, 24, { pos.x + 24.f, pos.y + 20.f }, titleColor));
    target.draw(makeText(*font, m_message, 16, { pos.x + 24.f, pos.y + 64.f }));
}
