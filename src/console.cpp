#include "console.h"
#include "bridge/async_bridge.h"
#include <QSocketNotifier>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <unistd.h>

using namespace SimShell;

Console::Console(AsyncBridge& bridge, QObject* parent) : QObject(parent), bridge_(bridge) {
    connect(&bridge_, &AsyncBridge::logAppended, this, &Console::onLogAppended);
    connect(&bridge_, &AsyncBridge::stateChanged, this, [](SimulationState state, const QString& error){
        std::cout << "state: " << to_string(state);
        if(!error.isEmpty()) std::cout << " (" << error.toStdString() << ")";
        std::cout << std::endl;
    });
}

void Console::start(){
    std::cout << "SimShell console (" << bridge_.engineName().toStdString() << "). type 'help' for commands." << std::endl;
    notifier_ = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this, &Console::onInput);
    prompt();
}

void Console::prompt() const {
    std::cout << "> " << std::flush;
}

void Console::onInput(){
    // Read the descriptor directly: several pasted lines can arrive in one
    // notification and none may be left behind in a stream buffer.
    char buf[4096];
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if(n < 0 && errno == EINTR) return;
    if(n <= 0){
        if(n < 0) std::cerr<<"stdin read failed: "<<std::strerror(errno)<<std::endl;
        notifier_->setEnabled(false);
        if(!pending_.empty()){
            std::string last;
            last.swap(pending_);
            handle_command(last);
        }
        emit finished();
        return;
    }
    if(!feed(std::string(buf, static_cast<size_t>(n)))){
        notifier_->setEnabled(false);
        emit finished();
        return;
    }
    prompt();
}

bool Console::feed(const std::string& chunk){
    pending_ += chunk;
    size_t nl;
    while((nl = pending_.find('\n')) != std::string::npos){
        std::string line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        if(!line.empty() && line.back() == '\r') line.pop_back();
        if(line.empty()) continue;
        if(!handle_command(line)){
            pending_.clear();
            return false;
        }
    }
    return true;
}

void Console::onLogAppended(const LogEntry& entry){
    // App entries already reach stdout through the logger.
    if(entry.source == LogSource::Monitor) std::cout << entry.text.toStdString() << std::endl;
}

bool Console::handle_command(const std::string& line){
    std::istringstream ss(line);
    std::string cmd; ss >> cmd;

    if(cmd == "help"){
        std::cout<<"Control:  load <path>, start, pause, reset, state"<<std::endl;
        std::cout<<"Watches:  watch <0xaddr> <name> [type], unwatch <name>, watches, poll"<<std::endl;
        std::cout<<"Monitor:  mon <command...>"<<std::endl;
        std::cout<<"          quit"<<std::endl;
        std::cout<<"Types:    uint8 uint16 uint32 uint64 int8 int16 int32 int64 float32 float64"<<std::endl;
        return true;
    } else if(cmd == "load"){
        std::string path; std::getline(ss >> std::ws, path);
        bridge_.requestLoadScript(QString::fromStdString(path));
        return true;
    } else if(cmd == "start"){
        bridge_.requestStart();
        return true;
    } else if(cmd == "pause"){
        bridge_.requestPause();
        return true;
    } else if(cmd == "reset"){
        bridge_.requestReset();
        return true;
    } else if(cmd == "state"){
        std::cout<<"state: "<<to_string(bridge_.state());
        if(bridge_.isControlPending()) std::cout<<" ("<<to_string(bridge_.pendingControl()->command)<<" pending)";
        std::cout<<", polling "<<(bridge_.isPolling() ? "on" : "off")<<std::endl;
        if(!bridge_.lastError().isEmpty()) std::cout<<"last error: "<<bridge_.lastError().toStdString()<<std::endl;
        return true;
    } else if(cmd == "watch"){
        std::string addr, name, type_name = "uint32";
        if(!(ss>>addr>>name)){ std::cout<<"usage: watch <0xaddr> <name> [type]"<<std::endl; return true; }
        ss >> type_name;
        auto type = parse_data_type(type_name);
        if(!type){ std::cout<<"unknown type: "<<type_name<<std::endl; return true; }
        bridge_.addWatch(QString::fromStdString(addr), QString::fromStdString(name), *type);
        return true;
    } else if(cmd == "unwatch"){
        std::string name;
        if(!(ss>>name)){ std::cout<<"usage: unwatch <name>"<<std::endl; return true; }
        if(!bridge_.removeWatch(QString::fromStdString(name))) std::cout<<"no watch named "<<name<<std::endl;
        return true;
    } else if(cmd == "watches"){
        print_watches();
        return true;
    } else if(cmd == "poll"){
        if(!bridge_.pollNow()) std::cout<<"polling needs a running simulation"<<std::endl;
        return true;
    } else if(cmd == "mon"){
        std::string text; std::getline(ss >> std::ws, text);
        bridge_.requestMonitorCommand(QString::fromStdString(text));
        return true;
    } else if(cmd == "quit" || cmd == "exit"){
        return false;
    }
    std::cout<<"unknown command: "<<cmd<<" (try 'help')"<<std::endl;
    return true;
}

void Console::print_watches() const {
    const auto& entries = bridge_.watches().entries();
    if(entries.empty()){ std::cout<<"no watches"<<std::endl; return; }
    for(const auto& w : entries){
        std::cout<<w.name<<"  "<<format_address(w.address)<<"  "<<data_type_name(w.type)<<"  "<<w.display_value();
        if(w.last_error) std::cout<<"  [error: "<<*w.last_error<<"]";
        if(w.read_in_flight) std::cout<<"  (reading)";
        std::cout<<std::endl;
    }
}
