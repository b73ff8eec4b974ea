/**
 * @file input_demo.cpp
 * @brief Scripted walk through a menu + gameplay setup, printing action events
 *
 * Build with: cmake -DFINEINPUT_BUILD_EXAMPLES=ON ..
 * Run from build directory: ./input_demo [input.conf]
 *
 * No window is opened. Each frame presses or releases keys on an
 * InputSnapshot the way a platform layer would, then prints the actions
 * whose events changed.
 */

#include <fineinput/config.hpp>
#include <fineinput/input_manager.hpp>
#include <fineinput/log.hpp>

#include <functional>
#include <iostream>
#include <string>
#include <vector>

using namespace fineinput;

namespace {

struct Frame {
    std::string label;
    std::function<void(InputSnapshot&)> script;
};

void printEvents(const InputContext& context) {
    for (const Action* action : context.actions().actions()) {
        if (action->events().isEmpty()) {
            continue;
        }
        std::cout << "  " << context.name() << "." << action->name()
                  << " [" << actionStateName(action->state()) << "] "
                  << action->events().toString()
                  << " value=" << action->value().toString() << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    InputSettings settings;
    if (argc > 1) {
        if (auto loaded = InputSettings::load(argv[1])) {
            settings = *loaded;
        }
    }
    settings.apply();

    InputManager manager(settings);

    InputContext& menu = manager.addContext("menu", false);
    menu.bind("close", ActionValueDim::Bool)
        .to(KeyCode::Escape)
        .withConditions({Press{}});

    InputContext& gameplay = manager.addContext("gameplay");
    gameplay.bind("move", ActionValueDim::Axis2D)
        .to(Cardinal::wasdKeys())
        .to(Axial::leftStick())
        .withModifiers({DeadZone::fromSettings(settings), DeltaScale{}});
    gameplay.bind("jump", ActionValueDim::Bool)
        .to(KeyCode::Space)
        .withConditions({Press{}});
    gameplay.bind("charge", ActionValueDim::Bool)
        .to(MouseButton::Right)
        .withConditions({Hold::fromSettings(settings)});
    gameplay.bind("open_menu", ActionValueDim::Bool)
        .to(KeyCode::Escape)
        .withConditions({Release{}});

    std::vector<Frame> frames = {
        {"walk forward", [](InputSnapshot& s) { s.pressKey(KeyCode::KeyW); }},
        {"strafe right", [](InputSnapshot& s) { s.pressKey(KeyCode::KeyD); }},
        {"jump", [](InputSnapshot& s) { s.pressKey(KeyCode::Space); }},
        {"land", [](InputSnapshot& s) {
            s.releaseKey(KeyCode::Space);
            s.releaseKey(KeyCode::KeyW);
            s.releaseKey(KeyCode::KeyD);
        }},
        {"start charge", [](InputSnapshot& s) { s.pressMouseButton(MouseButton::Right); }},
        {"charging", [](InputSnapshot&) {}},
        {"charging", [](InputSnapshot&) {}},
        {"release charge", [](InputSnapshot& s) { s.releaseMouseButton(MouseButton::Right); }},
        {"press escape", [](InputSnapshot& s) { s.pressKey(KeyCode::Escape); }},
        {"release escape", [](InputSnapshot& s) { s.releaseKey(KeyCode::Escape); }},
        {"close menu", [](InputSnapshot& s) { s.pressKey(KeyCode::Escape); }},
    };

    const float dt = 0.25f;
    InputSnapshot snapshot;
    for (const auto& frame : frames) {
        snapshot.beginFrame();
        frame.script(snapshot);
        manager.update(snapshot, dt);

        std::cout << "t=" << manager.time().elapsed << " " << frame.label << "\n";
        printEvents(gameplay);
        printEvents(menu);

        // Swap contexts the way a game would when the menu opens or closes
        if (gameplay.action("open_menu")->events().fired()) {
            manager.setActive("gameplay", false);
            manager.setActive("menu", true);
            log::info("Menu opened");
        } else if (menu.action("close")->events().fired()) {
            manager.setActive("menu", false);
            manager.setActive("gameplay", true);
            log::info("Menu closed");
        }
    }

    return 0;
}
