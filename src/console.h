#pragma once
#include <QObject>
#include <string>

class QSocketNotifier;

namespace SimShell {
class AsyncBridge;
struct LogEntry;
}

// Line-oriented stdin front-end for running without a display. Reads are
// driven by the event loop so bridge completions keep flowing between lines.
class Console : public QObject {
    Q_OBJECT

public:
    explicit Console(SimShell::AsyncBridge& bridge, QObject* parent = nullptr);

    void start();
    // Returns false when the console should exit.
    bool handle_command(const std::string& line);
    // Runs every complete line in chunk; a trailing partial line is kept
    // for the next call. Returns false once a line asked to exit.
    bool feed(const std::string& chunk);

signals:
    void finished();

private slots:
    void onInput();
    void onLogAppended(const SimShell::LogEntry& entry);

private:
    void print_watches() const;
    void prompt() const;

    SimShell::AsyncBridge& bridge_;
    QSocketNotifier* notifier_{nullptr};
    std::string pending_;
};
