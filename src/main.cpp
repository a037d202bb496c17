#include <SFML/Graphics.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "game/GridView.hpp"
#include "game/Reconciler.hpp"
#include "net/EventQueue.hpp"
#include "net/NetCommon.hpp"
#include "net/TransportWorker.hpp"
#include "ui/LoginScreen.hpp"
#include "ui/Widgets.hpp"

struct Args {
    std::string host = kDefaultServerHost;
    std::string port = kDefaultServerPort;
    std::string login;
    std::string password;
    bool help = false;
};

static Args parseArgs(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];

        if (s == "--host" && i + 1 < argc) { a.host = argv[++i]; }
        else if (s == "--port" && i + 1 < argc) { a.port = argv[++i]; }
        else if (s == "--login" && i + 1 < argc) { a.login = argv[++i]; }
        else if (s == "--password" && i + 1 < argc) { a.password = argv[++i]; }
        else if (s == "--help" || s == "-h") { a.help = true; }
    }
    return a;
}

static void printUsage(const char* exe) {
    std::cout << "Usage: " << exe << " [--host <ip>] [--port <port>] [--login <name>] [--password <pw>]\n"
              << "  --host      server address (default " << kDefaultServerHost << ")\n"
              << "  --port      server port (default " << kDefaultServerPort << ")\n"
              << "  --login     prefill the login field\n"
              << "  --password  prefill the password field\n";
}

// Everything that lives for one logged-in session. Member order matters:
// the worker pushes into events and the reconciler sends through the worker.
struct GameSession {
    EventQueue events;
    TransportWorker transport;
    GridView grid;
    Reconciler reconciler;

    GameSession(const Session& s, sf::Vector2f gridOrigin)
        : transport(s.websocketUrl, s.token, events)
        , grid(game::kGridWidth, game::kGridHeight, gridOrigin)
        , reconciler(s, transport, grid)
    {
    }
};

int main(int argc, char** argv) {
    const Args args = parseArgs(argc, argv);
    if (args.help) {
        printUsage(argv[0]);
        return 0;
    }

    const sf::Vector2u winSize{ 1220U, 700U };
    sf::RenderWindow window(sf::VideoMode(winSize, 32U), "GridLink", sf::Style::Titlebar | sf::Style::Close);
    window.setFramerateLimit(60);

    sf::Font font;

    auto tryFont = [&](const char* p) -> bool {
        if (font.openFromFile(p)) { std::cout << "[UI] Loaded font: " << p << "\n"; return true; }
        return false;
        };

    // Try a few likely working directories
    const bool hasFont =
        tryFont("assets/fonts/DejaVuSans.ttf") ||
        tryFont("../assets/fonts/DejaVuSans.ttf") ||
        tryFont("../../assets/fonts/DejaVuSans.ttf") ||
        tryFont("DejaVuSans.ttf") ||
        tryFont("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
    if (!hasFont) std::cerr << "[UI] No font found, text will not be drawn\n";
    const sf::Font* fontPtr = hasFont ? &font : nullptr;

    MessageDialog dialog(winSize);
    LoginScreen loginScreen(LoginDefaults{ args.login, args.password, Endpoint::fromFields(args.host, args.port) }, winSize);

    enum class Phase { Login, InGame, Leaving };
    Phase phase = Phase::Login;

    std::unique_ptr<GameSession> game;
    const sf::Vector2f gridOrigin{ 10.f, 80.f };
    Button exitBtn("Exit", { (float)winSize.x - 130.f, 16.f }, { 120.f, 44.f });

    // one modal per outage; re-armed by the next Opened
    bool errorReported = false;
    bool everConnected = false;

    sf::Clock frameClock;
    sf::Clock leaveClock;
    const sf::Time kLogoutGrace = sf::milliseconds(500);

    auto beginLeaving = [&]() {
        if (phase != Phase::InGame) return;
        std::cout << "[Client] Logging out\n";
        game->reconciler.logout();
        leaveClock.restart();
        phase = Phase::Leaving;
        };

    while (window.isOpen()) {
        const float dt = frameClock.restart().asSeconds();

        while (const std::optional ev = window.pollEvent()) {
            if (ev->is<sf::Event::Closed>()) {
                if (phase == Phase::InGame) beginLeaving();
                else if (phase == Phase::Login) window.close();
                continue;
            }

            if (dialog.handleEvent(*ev, window)) continue;

            if (phase == Phase::Login) {
                loginScreen.handleEvent(*ev, window, dialog);
                if (loginScreen.hasSession()) {
                    const Session& s = loginScreen.session();
                    std::cout << "[Client] Logged in as " << s.login << " (id " << s.userId << ")\n";

                    game = std::make_unique<GameSession>(s, gridOrigin);
                    game->transport.start();
                    phase = Phase::InGame;
                }
            }
            else if (phase == Phase::InGame) {
                if (const auto* kp = ev->getIf<sf::Event::KeyPressed>()) {
                    switch (kp->code) {
                    case sf::Keyboard::Key::W: game->reconciler.moveLocal(0, -1); break;
                    case sf::Keyboard::Key::S: game->reconciler.moveLocal(0, 1); break;
                    case sf::Keyboard::Key::A: game->reconciler.moveLocal(-1, 0); break;
                    case sf::Keyboard::Key::D: game->reconciler.moveLocal(1, 0); break;
                    case sf::Keyboard::Key::Escape: beginLeaving(); break;
                    default: break;
                    }
                }
                else if (const auto* mb = ev->getIf<sf::Event::MouseButtonPressed>()) {
                    if (mb->button == sf::Mouse::Button::Left &&
                        exitBtn.contains(window.mapPixelToCoords(mb->position))) {
                        beginLeaving();
                    }
                }
            }
        }

        if (game) {
            for (const TransportEvent& tev : game->events.drain()) {
                game->reconciler.onTransportEvent(tev);

                if (tev.kind == TransportEvent::Kind::Opened) {
                    everConnected = true;
                    errorReported = false;
                }
                else if (tev.kind == TransportEvent::Kind::Error && !errorReported && phase == Phase::InGame) {
                    errorReported = true;
                    dialog.show(MessageDialog::Kind::Error, "Connection error", tev.text);
                }
            }

            if (phase == Phase::InGame) {
                game->reconciler.tick(dt);
            }
            else if (phase == Phase::Leaving && leaveClock.getElapsedTime() >= kLogoutGrace) {
                if (!game->transport.stop()) {
                    std::cerr << "[Client] Transport did not stop cleanly\n";
                }
                game.reset();
                window.close();
                break;
            }
        }

        const sf::Vector2f mouse = window.mapPixelToCoords(sf::Mouse::getPosition(window));

        window.clear(sf::Color(20, 20, 26));

        if (phase == Phase::Login) {
            loginScreen.draw(window, fontPtr, mouse);
        }
        else if (game) {
            game->grid.render(window, fontPtr);
            exitBtn.draw(window, fontPtr, exitBtn.contains(mouse));

            if (hasFont) {
                std::string status;
                sf::Color statusColor = sf::Color(120, 220, 120);
                if (phase == Phase::Leaving) {
                    status = "Logging out...";
                    statusColor = sf::Color(200, 200, 200);
                }
                else if (game->reconciler.connected()) {
                    status = "Connected to server.";
                }
                else if (everConnected || errorReported) {
                    status = "Disconnected from server. Reconnecting every 5 seconds...";
                    statusColor = sf::Color(240, 110, 110);
                }
                else {
                    status = "Connecting to " + game->reconciler.session().websocketUrl + "...";
                    statusColor = sf::Color(240, 200, 90);
                }
                window.draw(makeText(font, status, 18, { 12.f, 14.f }, statusColor));

                const game::Position& p = game->reconciler.localPosition();
                window.draw(makeText(font,
                    "Your position: (" + std::to_string((int)p.x) + ", " + std::to_string((int)p.y) + ")",
                    18, { 12.f, 44.f }));
            }
        }

        dialog.draw(window, fontPtr);
        window.display();
    }

    return 0;
}
