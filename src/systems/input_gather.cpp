#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <algorithm>
#include <cstring>
#include <iterator>

// Some platforms enumerate keyboards, sensors and audio jacks as joysticks.
static bool is_controller(int index) {
    if (!IsGamepadAvailable(index) || GetGamepadAxisCount(index) < 4) return false;

    const char* name = GetGamepadName(index);
    if (!name) return false;

    static const char* const kNotControllers[] = {
        "Keyboard", "Mouse", "Trackpad", "Touchpad", "Accelerometer",
        "Sensor", "Headset", "Mic", "Speaker", "Consumer Control",
        "System Control", "Power Button", "HDA Intel", "SMC", "Video",
    };
    return std::none_of(std::begin(kNotControllers), std::end(kNotControllers),
                        [name](const char* word) { return std::strstr(name, word) != nullptr; });
}

static GamepadState sample_gamepad(int index) {
    GamepadState gp;
    gp.id = index;

    const int axes = std::min(GetGamepadAxisCount(index), kMaxGamepadAxes);
    for (int a = 0; a < axes; ++a) gp.axes[a] = GetGamepadAxisMovement(index, a);

    for (int b = 0; b < kMaxGamepadButtons; ++b) {
        gp.buttons[b] = {IsGamepadButtonDown(index, b),
                         IsGamepadButtonPressed(index, b),
                         IsGamepadButtonReleased(index, b)};
    }
    return gp;
}

void InputGatherSystem::Update(ecs::World& world) {
    if (!world.try_resource<InputRecord>()) world.set_resource(InputRecord{});
    InputRecord& input = world.resource<InputRecord>();

    for (int k = 0; k < kMaxKeys; ++k) {
        input.keys[k] = {IsKeyDown(k), IsKeyPressed(k), IsKeyReleased(k)};
    }

    const Vector2 delta = GetMouseDelta();
    input.mouse_delta   = {delta.x, delta.y};

    input.gamepads.clear();
    for (int i = 0; i < kMaxGamepads; ++i) {
        if (is_controller(i)) input.gamepads.push_back(sample_gamepad(i));
    }
}
