#include <SFML/Graphics.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <optional>

#include "net/NetCommon.hpp"
#include "net/SteamFlatBackend.hpp"
#include "net/HostCoordinator.hpp"

struct Args {
    uint32_t appId = 0;
    std::string steamLib;
    std::string name = "My Session";

    // Invite accepted while the game was closed
    hostlink::PeerId inviter = hostlink::kNoPeer;
    std::string inviteToken;

    hostlink::PeerId connectLobby = hostlink::kNoPeer;
};

static hostlink::PeerId parseId(const char* s) {
    hostlink::PeerId id = hostlink::kNoPeer;
    if (hostlink::normalizeIdentifier(hostlink::textValue(s), id) != hostlink::Status::Ok) {
        std::cerr << "[Args] Not an id: " << s << "\n";
        return hostlink::kNoPeer;
    }
    return id;
}

static Args parseArgs(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];

        if (s == "--app-id" && i + 1 < argc) { a.appId = (uint32_t)std::stoul(argv[++i]); }
        else if (s == "--steam-lib" && i + 1 < argc) { a.steamLib = argv[++i]; }
        else if (s == "--name" && i + 1 < argc) { a.name = argv[++i]; }
        else if (s == "+connect_lobby" && i + 1 < argc) { a.connectLobby = parseId(argv[++i]); }
        else if (s == "--invite" && i + 1 < argc) {
            a.inviter = parseId(argv[++i]);
            if (i + 1 < argc && argv[i + 1][0] != '-' && argv[i + 1][0] != '+') a.inviteToken = argv[++i];
        }
    }
    return a;
}

static void report(const char* what, hostlink::Status s) {
    if (s == hostlink::Status::Ok) std::cout << "[UI] " << what << ": ok\n";
    else std::cerr << "[UI] " << what << ": " << hostlink::statusName(s) << "\n";
}

int main(int argc, char** argv) {
    const Args args = parseArgs(argc, argv);

    NetRuntime rt;
    if (!rt.init()) std::cerr << "[UI] Networking runtime unavailable, continuing without it\n";

    SteamBackendConfig backendCfg;
    backendCfg.libraryPath = args.steamLib;
    backendCfg.appId = args.appId;
    SteamFlatBackend backend(backendCfg);

    HostLinkConfig cfg;
    cfg.selfSessionName = args.name;
    HostCoordinator hc(cfg);

    if (backend.load()) backend.registerShapes(hc.binder());
    rt.registerShapes(hc.binder());

    if (!backend.isLoaded() || !backend.start(hc.binder())) {
        std::cerr << "[UI] Platform client not running; discovery will stay empty\n";
    }

    hc.onMemberJoined([](hostlink::PeerId id, const std::string& name) {
        std::cout << "[UI] " << name << " (" << id << ") joined the session\n";
    });

    if (args.inviter != hostlink::kNoPeer) {
        hc.onInviteReceived(args.inviter, args.inviteToken);
        report("Join from invite", hc.requestAutoJoin());
    }
    else if (args.connectLobby != hostlink::kNoPeer) {
        report("Join group", hc.requestJoin(args.connectLobby));
    }

    sf::RenderWindow window(sf::VideoMode({ 1280U, 720U }, 32U), "HostLink");
    window.setFramerateLimit(60);

    sf::Font font;

    auto tryFont = [&](const char* p) -> bool {
        if (font.openFromFile(p)) { std::cout << "[UI] Loaded font: " << p << "\n"; return true; }
        return false;
        };

    const bool hasFont =
        tryFont("assets/fonts/bubbly.ttf") ||
        tryFont("../assets/fonts/bubbly.ttf") ||
        tryFont("../../assets/fonts/bubbly.ttf") ||
        tryFont("bubbly.ttf");
    if (!hasFont) std::cerr << "[UI] No font found, text will not render\n";

    auto mkText = [&](const std::string& s, unsigned size, sf::Vector2f pos) {
        sf::Text t(font);
        t.setString(s);
        t.setCharacterSize(size);
        t.setPosition(pos);
        return t;
        };

    const float left = 60.f;
    const float top = 90.f;
    const float rowH = 56.f;
    const float rowW = 1160.f;

    sf::RectangleShape rowRect({ rowW, rowH });
    rowRect.setOutlineThickness(2.f);

    std::vector<hostlink::HostInfo> list;

    int selectedIdx = -1;
    sf::Clock uiClock;
    float lastClickAt = -1000.f;
    int lastClickIdx = -1;

    auto tryJoinIndex = [&](int idx) {
        if (idx < 0 || idx >= (int)list.size()) return;
        if (hc.state().phase != hostlink::SessionPhase::Idle) return;

        const auto& h = list[idx];
        std::cout << "[UI] Joining " << h.sessionName << " (" << h.peerId << ")\n";
        report("Join", hc.requestJoin(h.peerId));
        };

    while (window.isOpen()) {
        while (const std::optional ev = window.pollEvent())
        {
            if (ev->is<sf::Event::Closed>()) window.close();

            if (const auto* kp = ev->getIf<sf::Event::KeyPressed>())
            {
                if (kp->code == sf::Keyboard::Key::Escape)
                {
                    if (hc.state().phase != hostlink::SessionPhase::Idle) report("Stop", hc.requestStop());
                    else window.close();
                }
                if (kp->code == sf::Keyboard::Key::H) report("Host", hc.requestHost());
                if (kp->code == sf::Keyboard::Key::J) report("Auto-join", hc.requestAutoJoin());
                if (kp->code == sf::Keyboard::Key::Enter) tryJoinIndex(selectedIdx);
            }

            if (const auto* mb = ev->getIf<sf::Event::MouseButtonPressed>())
            {
                if (mb->button == sf::Mouse::Button::Left)
                {
                    const sf::Vector2f mp = window.mapPixelToCoords(mb->position);
                    const float relY = mp.y - top;

                    if (mp.x >= left && mp.x <= left + rowW && relY >= 0.f)
                    {
                        const int idx = (int)(relY / rowH);
                        if (idx >= 0 && idx < (int)list.size())
                        {
                            const float now = uiClock.getElapsedTime().asSeconds();
                            const bool isDouble = (idx == lastClickIdx) && ((now - lastClickAt) < 0.35f);

                            selectedIdx = idx;
                            if (isDouble) tryJoinIndex(idx);

                            lastClickIdx = idx;
                            lastClickAt = now;
                        }
                    }
                }
            }
        }

        rt.pumpCallbacks();
        hc.tick();

        list = hc.activeHosts();
        if (selectedIdx >= (int)list.size()) selectedIdx = -1;

        const auto st = hc.state();

        window.clear(sf::Color(16, 16, 22));

        window.draw(mkText("Friends' sessions (double-click to join)    H=Host   J=Auto-join   Esc=Stop/Quit", 20, { left, 30.f }));
        window.draw(mkText(std::string("State: ") + hostlink::phaseName(st.phase)
            + (st.groupId ? "   group " + std::to_string(st.groupId) : std::string()), 16, { left, 55.f }));

        if (list.empty()) {
            window.draw(mkText("No friends hosting right now.", 18, { left, top }));
        }

        for (int i = 0; i < (int)list.size(); ++i) {
            const auto& h = list[i];

            rowRect.setPosition({ left, top + i * rowH });
            rowRect.setFillColor(i == selectedIdx ? sf::Color(35, 90, 55) : sf::Color(25, 70, 35));
            rowRect.setOutlineColor(i == selectedIdx ? sf::Color(220, 220, 255) : sf::Color(120, 180, 140));
            window.draw(rowRect);

            const std::string line1 = h.sessionName + "   (" + std::to_string(h.playerCount) + " player"
                + (h.playerCount == 1 ? "" : "s") + ")";
            window.draw(mkText(line1, 18, { left + 14.f, top + i * rowH + 8.f }));
            window.draw(mkText("host " + std::to_string(h.peerId), 14, { left + 14.f, top + i * rowH + 30.f }));
        }

        window.display();
    }

    if (hc.state().phase != hostlink::SessionPhase::Idle) report("Stop", hc.requestStop());
    backend.stop();
    return 0;
}
