#include "LoginScreen.hpp"
#include <iostream>

namespace {

const float kFormWidth = 360.f;
const float kRowH = 50.f;

void report(const AuthResult& r, MessageDialog& dialog) {
    switch (r.status) {
    case AuthStatus::Ok:
        dialog.show(MessageDialog::Kind::Info, "Success", r.message);
        break;
    case AuthStatus::InvalidInput:
    case AuthStatus::Rejected:
        dialog.show(MessageDialog::Kind::Warning, "Error", r.message);
        break;
    case AuthStatus::Unreachable:
        dialog.show(MessageDialog::Kind::Error, "Connection error", r.message);
        break;
    case AuthStatus::BadToken:
        dialog.show(MessageDialog::Kind::Error, "Token error", r.message);
        break;
    }
}

} // namespace

LoginScreen::LoginScreen(const LoginDefaults& defaults, sf::Vector2u windowSize)
    : m_loginBtn("Login", { 0.f, 0.f }, { 170.f, 44.f })
    , m_registerBtn("Register", { 0.f, 0.f }, { 170.f, 44.f })
{
    const float left = (windowSize.x - kFormWidth) / 2.f;
    const float top = windowSize.y / 2.f - 2.f * kRowH - 20.f;
    m_titlePos = { left, top - 60.f };

    m_fields.emplace_back("Login", sf::Vector2f{ left, top + 0 * kRowH }, kFormWidth);
    m_fields.emplace_back("Password", sf::Vector2f{ left, top + 1 * kRowH }, kFormWidth, true);
    m_fields.emplace_back(std::string("Server IP (default: ") + kDefaultServerHost + ")",
        sf::Vector2f{ left, top + 2 * kRowH }, kFormWidth);
    m_fields.emplace_back(std::string("Server port (default: ") + kDefaultServerPort + ")",
        sf::Vector2f{ left, top + 3 * kRowH }, kFormWidth);

    m_fields[LoginField].setText(defaults.login);
    m_fields[PasswordField].setText(defaults.password);
    m_fields[HostField].setText(defaults.endpoint.host);
    m_fields[PortField].setText(defaults.endpoint.port);

    const float btnY = top + 4 * kRowH + 10.f;
    m_loginBtn = Button("Login", { left, btnY }, { 170.f, 44.f });
    m_registerBtn = Button("Register", { left + kFormWidth - 170.f, btnY }, { 170.f, 44.f });

    focus(LoginField);
}

Endpoint LoginScreen::endpoint() const {
    return Endpoint::fromFields(m_fields[HostField].text(), m_fields[PortField].text());
}

void LoginScreen::focus(int idx) {
    m_focused = idx;
    for (int i = 0; i < (int)m_fields.size(); ++i) {
        m_fields[i].setFocused(i == idx);
    }
}

void LoginScreen::handleEvent(const sf::Event& ev, const sf::RenderWindow& window, MessageDialog& dialog) {
    if (const auto* te = ev.getIf<sf::Event::TextEntered>()) {
        // Tab and Enter arrive as KeyPressed too
        if (te->unicode != U'\t' && te->unicode != U'\r' && te->unicode != U'\n') {
            m_fields[m_focused].handleText(te->unicode);
        }
        return;
    }

    if (const auto* kp = ev.getIf<sf::Event::KeyPressed>()) {
        if (kp->code == sf::Keyboard::Key::Tab) {
            const int step = kp->shift ? FieldCount - 1 : 1;
            focus((m_focused + step) % FieldCount);
        }
        else if (kp->code == sf::Keyboard::Key::Enter) {
            submitLogin(dialog);
        }
        return;
    }

    if (const auto* mb = ev.getIf<sf::Event::MouseButtonPressed>()) {
        if (mb->button != sf::Mouse::Button::Left) return;
        const sf::Vector2f mp = window.mapPixelToCoords(mb->position);

        for (int i = 0; i < (int)m_fields.size(); ++i) {
            if (m_fields[i].contains(mp)) {
                focus(i);
                return;
            }
        }
        if (m_loginBtn.contains(mp)) submitLogin(dialog);
        else if (m_registerBtn.contains(mp)) submitRegister(dialog);
    }
}

void LoginScreen::submitLogin(MessageDialog& dialog) {
    AuthClient client(endpoint());
    std::cout << "[UI] Logging in at " << makeBaseUrl(client.endpoint()) << "\n";

    Session s;
    const AuthResult r = client.login(m_fields[LoginField].text(), m_fields[PasswordField].text(), s);
    if (!r.ok()) {
        report(r, dialog);
        return;
    }
    m_session = std::move(s);
}

void LoginScreen::submitRegister(MessageDialog& dialog) {
    AuthClient client(endpoint());
    std::cout << "[UI] Registering at " << makeBaseUrl(client.endpoint()) << "\n";

    report(client.registerUser(m_fields[LoginField].text(), m_fields[PasswordField].text()), dialog);
}

void LoginScreen::draw(sf::RenderTarget& target, const sf::Font* font, sf::Vector2f mouse) const {
    if (font) {
        target.draw(makeText(*font, "Login / Register", 28, m_titlePos));
        target.draw(makeText(*font, "Tab = next field   Enter = login", 14,
            { m_titlePos.x, m_titlePos.y + 36.f }, sf::Color(150, 150, 160)));
    }

    for (const auto& f : m_fields) f.draw(target, font);

    m_loginBtn.draw(target, font, m_loginBtn.contains(mouse));
    m_registerBtn.draw(target, font, m_registerBtn.contains(mouse));
}
