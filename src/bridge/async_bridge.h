#pragma once

#include "bridge/dispatcher.h"
#include "bridge/state_machine.h"
#include "bridge/watch_registry.h"
#include "core/logger.h"
#include "engine/engine.h"

#include <QDateTime>
#include <QMetaType>
#include <QObject>
#include <QString>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

class QTimer;

namespace SimShell {

enum class LogSource { App, Monitor };

struct LogEntry {
    QDateTime timestamp;
    LogSource source{LogSource::App};
    log::Level level{log::Level::Info};
    QString text;
};

enum class RequestStatus {
    Accepted,
    Busy,
    InvalidTransition,
    InvalidInput,
    ShuttingDown
};

const char* to_string(RequestStatus status);

struct RequestResult {
    RequestStatus status{RequestStatus::Accepted};
    QString message;

    bool accepted() const { return status == RequestStatus::Accepted; }
};

enum class OperationKind { Control, Read, Monitor };

struct PendingOperation {
    uint64_t sequence{0};
    OperationKind kind{OperationKind::Control};
    ControlCommand command{ControlCommand::Reset};
    QString detail;
};

// Owns the engine and keeps every blocking call off the event-loop thread.
//
// All public methods must be called from the thread that owns the bridge and
// return immediately. Engine calls run on the dispatcher; their results are
// posted back to this object's thread before any bridge state is touched, so
// state, pending markers and watch values are only ever mutated here.
class AsyncBridge : public QObject
{
    Q_OBJECT

public:
    struct Options {
        size_t workers{2};
        std::chrono::milliseconds poll_interval{500};
        std::chrono::milliseconds call_timeout{0};   // 0 = no timeout
        std::chrono::milliseconds shutdown_grace{2000};
    };

    AsyncBridge(std::shared_ptr<Engine> engine, Options options, QObject *parent = nullptr);
    ~AsyncBridge() override;

    RequestResult requestLoadScript(const QString &path);
    RequestResult requestStart();
    RequestResult requestPause();
    RequestResult requestReset();
    RequestResult requestMonitorCommand(const QString &command);

    RequestResult addWatch(const QString &address, const QString &name, DataType type);
    bool removeWatch(const QString &name);

    // Runs one poll cycle right away. Returns false when not Running.
    bool pollNow();

    // Stops polling, discards late results and releases the workers.
    void shutdown();

    void setPollInterval(std::chrono::milliseconds interval);

    SimulationState state() const { return m_machine.state(); }
    QString lastError() const { return QString::fromStdString(m_machine.last_error()); }
    bool isControlPending() const { return m_pendingControl.has_value(); }
    bool isControlCallInEngine() const { return m_controlInEngine.has_value(); }
    std::optional<PendingOperation> pendingControl() const { return m_pendingControl; }
    bool isMonitorCommandPending() const { return m_pendingMonitor.has_value(); }
    size_t queuedMonitorCommands() const { return m_monitorQueue.size(); }
    bool isPolling() const;
    bool isShutDown() const { return m_shutDown; }
    uint64_t pollCycles() const { return m_pollCycles; }
    uint64_t skippedReads() const { return m_skippedReads; }

    const WatchRegistry &watches() const { return m_watches; }
    const std::vector<LogEntry> &appLog() const { return m_appLog; }
    const std::vector<LogEntry> &monitorLog() const { return m_monitorLog; }
    QString engineName() const;

signals:
    void stateChanged(SimShell::SimulationState state, const QString &error);
    void controlPendingChanged(bool pending);
    void logAppended(const SimShell::LogEntry &entry);
    void watchAdded(const QString &name);
    void watchRemoved(const QString &name);
    void watchUpdated(const QString &name);
    void requestRejected(const QString &reason);

private:
    class CompletionSink;

    template <typename Work, typename Done>
    void dispatch(Work work, Done done);

    RequestResult requestControl(ControlCommand command, std::function<void(Engine &)> call,
                                 const QString &detail);
    void finishControl(uint64_t sequence, ControlCommand command, std::future<void> &result);
    void controlTimedOut(uint64_t sequence);
    void failState(const QString &error);

    void startNextMonitorCommand();
    void finishMonitorCommand(uint64_t sequence, std::future<std::string> &result);
    void monitorTimedOut(uint64_t sequence);

    void pollWatches();
    void finishRead(uint64_t watchId, uint64_t generation, std::future<ScalarValue> &result);
    void finishStatusProbe(uint64_t epoch, std::future<bool> &result);
    void updatePolling();

    void appendLog(LogSource source, log::Level level, const QString &text);
    RequestResult reject(RequestStatus status, const QString &message);

    std::shared_ptr<Engine> m_engine;
    Options m_options;
    std::unique_ptr<Dispatcher> m_dispatcher;
    std::shared_ptr<CompletionSink> m_sink;
    QTimer *m_pollTimer;

    StateMachine m_machine;
    std::optional<PendingOperation> m_pendingControl;
    std::optional<PendingOperation> m_pendingMonitor;
    // Sequence of the call still inside the engine. Outlives the pending
    // marker when a call times out, until the worker really returns.
    std::optional<uint64_t> m_controlInEngine;
    std::optional<uint64_t> m_monitorInEngine;
    std::deque<QString> m_monitorQueue;
    uint64_t m_nextSequence;
    uint64_t m_controlEpoch;      // bumped per accepted control command
    uint64_t m_watchGeneration;   // bumped per accepted reset
    bool m_statusProbeInFlight;
    bool m_shutDown;
    uint64_t m_pollCycles;
    uint64_t m_skippedReads;

    WatchRegistry m_watches;
    std::vector<LogEntry> m_appLog;
    std::vector<LogEntry> m_monitorLog;
};

} // namespace SimShell

Q_DECLARE_METATYPE(SimShell::SimulationState)
Q_DECLARE_METATYPE(SimShell::LogEntry)
