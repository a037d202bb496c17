#pragma once
#include <SFML/Graphics.hpp>
#include <optional>
#include <string>
#include <vector>

#include "Widgets.hpp"
#include "net/AuthClient.hpp"
#include "net/NetCommon.hpp"

struct LoginDefaults {
    std::string login;
    std::string password;
    Endpoint endpoint;
};

// Login / register form. Produces a Session on successful login.
class LoginScreen {
public:
    enum Field { LoginField = 0, PasswordField, HostField, PortField, FieldCount };

    LoginScreen(const LoginDefaults& defaults, sf::Vector2u windowSize);

    // Blocking HTTP happens inside; results are reported through dialog.
    void handleEvent(const sf::Event& ev, const sf::RenderWindow& window, MessageDialog& dialog);
    void draw(sf::RenderTarget& target, const sf::Font* font, sf::Vector2f mouse) const;

    bool hasSession() const { return m_session.has_value(); }
    const Session& session() const { return *m_session; }

    Endpoint endpoint() const;

private:
    void submitLogin(MessageDialog& dialog);
    void submitRegister(MessageDialog& dialog);
    void focus(int idx);

private:
    std::vector<TextField> m_fields;
    int m_focused{ LoginField };

    Button m_loginBtn;
    Button m_registerBtn;
    sf::Vector2f m_titlePos;

    std::optional<Session> m_session;
};
