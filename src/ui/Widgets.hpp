#pragma once
#include <SFML/Graphics.hpp>
#include <string>

sf::Text makeText(const sf::Font& font, const std::string& s, unsigned size, sf::Vector2f pos,
    sf::Color color = sf::Color::White);

class Button {
public:
    Button(std::string label, sf::Vector2f pos, sf::Vector2f size);

    bool contains(sf::Vector2f p) const { return m_box.getGlobalBounds().contains(p); }
    void draw(sf::RenderTarget& target, const sf::Font* font, bool hovered) const;

private:
    std::string m_label;
    sf::RectangleShape m_box;
};

// Single-line ASCII input.
class TextField {
public:
    static constexpr size_t kMaxLength = 64;

    TextField(std::string placeholder, sf::Vector2f pos, float width, bool masked = false);

    void setText(std::string text);
    const std::string& text() const { return m_text; }

    void setFocused(bool f) { m_focused = f; }

    bool contains(sf::Vector2f p) const { return m_box.getGlobalBounds().contains(p); }

    // Feeds one TextEntered code point. Backspace erases.
    void handleText(char32_t unicode);

    void draw(sf::RenderTarget& target, const sf::Font* font) const;

private:
    std::string m_placeholder;
    std::string m_text;
    bool m_masked{ false };
    bool m_focused{ false };
    sf::RectangleShape m_box;
};

// Modal notification; swallows all input until dismissed.
class MessageDialog {
public:
    enum class Kind { Info, Warning, Error };

    explicit MessageDialog(sf::Vector2u windowSize);

    void show(Kind kind, std::string title, std::string message);
    void dismiss() { m_visible = false; }

    // true if the event was consumed by the dialog
    bool handleEvent(const sf::Event& ev, const sf::RenderWindow& window);

    void draw(sf::RenderTarget& target, const sf::Font* font) const;

private:
    bool m_visible{ false };
    Kind m_kind{ Kind::Info };
    std::string m_title;
    std::string m_message;

    sf::RectangleShape m_overlay;
    sf::RectangleShape m_box;
    Button m_okButton;
};
