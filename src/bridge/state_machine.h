#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace SimShell {

enum class SimulationState {
    Idle,
    Loaded,
    Running,
    Paused,
    Stopped,
    Error
};

enum class ControlCommand {
    LoadScript,
    Start,
    Pause,
    Reset
};

const char* to_string(SimulationState state);
const char* to_string(ControlCommand command);

// Lifecycle rules for control commands. Pure: no engine, no threads.
class StateMachine {
public:
    SimulationState state() const { return state_; }
    const std::string& last_error() const { return last_error_; }

    // State reached when command completes successfully from from, or
    // nullopt when command is not allowed in from.
    static std::optional<SimulationState> target(ControlCommand command, SimulationState from);

    bool can_apply(ControlCommand command) const { return target(command, state_).has_value(); }

    // Applies a completed command. Returns false (state untouched) when the
    // command was not valid from the current state.
    bool complete(ControlCommand command);

    // Any failed engine call lands here; reset is the only way back out.
    void fail(const std::string& error);

    // The engine reported it stopped on its own while running.
    bool engine_stopped();

private:
    SimulationState state_{SimulationState::Idle};
    std::string last_error_;
};

} // namespace SimShell
