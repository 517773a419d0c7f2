#include "state_machine.h"

namespace SimShell {

const char* to_string(SimulationState state){
    switch(state){
        case SimulationState::Idle:    return "Idle";
        case SimulationState::Loaded:  return "Loaded";
        case SimulationState::Running: return "Running";
        case SimulationState::Paused:  return "Paused";
        case SimulationState::Stopped: return "Stopped";
        case SimulationState::Error:   return "Error";
    }
    return "?";
}

const char* to_string(ControlCommand command){
    switch(command){
        case ControlCommand::LoadScript: return "load_script";
        case ControlCommand::Start:      return "start";
        case ControlCommand::Pause:      return "pause";
        case ControlCommand::Reset:      return "reset";
    }
    return "?";
}

std::optional<SimulationState> StateMachine::target(ControlCommand command, SimulationState from){
    switch(command){
        case ControlCommand::LoadScript:
            if(from == SimulationState::Idle) return SimulationState::Loaded;
            break;
        case ControlCommand::Start:
            if(from == SimulationState::Loaded || from == SimulationState::Paused || from == SimulationState::Stopped)
                return SimulationState::Running;
            break;
        case ControlCommand::Pause:
            if(from == SimulationState::Running) return SimulationState::Paused;
            break;
        case ControlCommand::Reset:
            return SimulationState::Idle;
    }
    return std::nullopt;
}

bool StateMachine::complete(ControlCommand command){
    auto next = target(command, state_);
    if(!next) return false;
    state_ = *next;
    if(state_ == SimulationState::Idle) last_error_.clear();
    return true;
}

void StateMachine::fail(const std::string& error){
    state_ = SimulationState::Error;
    last_error_ = error;
}

bool StateMachine::engine_stopped(){
    if(state_ != SimulationState::Running) return false;
    state_ = SimulationState::Stopped;
    return true;
}

} // namespace SimShell
