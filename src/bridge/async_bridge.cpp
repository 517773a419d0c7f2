#include "async_bridge.h"

#include <QTimer>
#include <exception>
#include <mutex>
#include <type_traits>

namespace SimShell {

const char* to_string(RequestStatus status){
    switch(status){
        case RequestStatus::Accepted:          return "accepted";
        case RequestStatus::Busy:              return "busy";
        case RequestStatus::InvalidTransition: return "invalid transition";
        case RequestStatus::InvalidInput:      return "invalid input";
        case RequestStatus::ShuttingDown:      return "shutting down";
    }
    return "?";
}

// Hands completions from worker threads to the bridge's thread. Once closed,
// everything delivered afterwards is dropped.
class AsyncBridge::CompletionSink
{
public:
    explicit CompletionSink(QObject *receiver) : m_receiver(receiver) {}

    void deliver(std::function<void()> fn)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_receiver)
            return;
        if (!QMetaObject::invokeMethod(m_receiver, std::move(fn), Qt::QueuedConnection))
            log::error("failed to post engine result to the event loop");
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_receiver = nullptr;
    }

private:
    std::mutex m_mutex;
    QObject *m_receiver;
};

namespace {
QString describe(std::exception_ptr failure)
{
    try {
        std::rethrow_exception(failure);
    } catch (const std::future_error &e) {
        return QString("engine call abandoned: %1").arg(e.what());
    } catch (const std::exception &e) {
        return QString::fromStdString(e.what());
    } catch (...) {
        return "unknown engine failure";
    }
}

// Waits on an already-ready future and converts a stored exception to text.
template <typename R>
std::optional<QString> failureOf(std::future<R> &result, R *value)
{
    try {
        *value = result.get();
        return std::nullopt;
    } catch (...) {
        return describe(std::current_exception());
    }
}

std::optional<QString> failureOf(std::future<void> &result)
{
    try {
        result.get();
        return std::nullopt;
    } catch (...) {
        return describe(std::current_exception());
    }
}
}

AsyncBridge::AsyncBridge(std::shared_ptr<Engine> engine, Options options, QObject *parent)
    : QObject(parent)
    , m_engine(std::move(engine))
    , m_options(options)
    , m_dispatcher(std::make_unique<Dispatcher>(options.workers))
    , m_sink(std::make_shared<CompletionSink>(this))
    , m_pollTimer(new QTimer(this))
    , m_nextSequence(1)
    , m_controlEpoch(0)
    , m_watchGeneration(0)
    , m_statusProbeInFlight(false)
    , m_shutDown(false)
    , m_pollCycles(0)
    , m_skippedReads(0)
{
    qRegisterMetaType<SimShell::SimulationState>();
    qRegisterMetaType<SimShell::LogEntry>();

    m_pollTimer->setInterval(static_cast<int>(m_options.poll_interval.count()));
    connect(m_pollTimer, &QTimer::timeout, this, &AsyncBridge::pollWatches);

    std::shared_ptr<CompletionSink> sink = m_sink;
    m_engine->set_log_handler([sink, this](const std::string &line) {
        sink->deliver([this, text = QString::fromStdString(line)] {
            appendLog(LogSource::Monitor, log::Level::Info, text);
        });
    });

    log::info(QString("bridge ready: engine=%1 workers=%2")
                  .arg(engineName())
                  .arg(m_dispatcher->worker_count())
                  .toStdString());
}

AsyncBridge::~AsyncBridge()
{
    shutdown();
}

QString AsyncBridge::engineName() const
{
    return QString::fromStdString(m_engine->name());
}

template <typename Work, typename Done>
void AsyncBridge::dispatch(Work work, Done done)
{
    using R = std::invoke_result_t<Work>;
    auto future = std::make_shared<std::future<R>>();
    std::shared_ptr<CompletionSink> sink = m_sink;
    // The completion only runs on this thread, after *future is assigned below.
    *future = m_dispatcher->submit(std::move(work), [sink, future, done]() {
        sink->deliver([future, done]() mutable { done(*future); });
    });
}

RequestResult AsyncBridge::requestLoadScript(const QString &path)
{
    if (path.trimmed().isEmpty())
        return reject(RequestStatus::InvalidInput, "load_script rejected: script path is empty");
    const std::string script = path.toStdString();
    return requestControl(ControlCommand::LoadScript,
                          [script](Engine &engine) { engine.load_script(script); }, path);
}

RequestResult AsyncBridge::requestStart()
{
    return requestControl(ControlCommand::Start, [](Engine &engine) { engine.start(); }, QString());
}

RequestResult AsyncBridge::requestPause()
{
    return requestControl(ControlCommand::Pause, [](Engine &engine) { engine.pause(); }, QString());
}

RequestResult AsyncBridge::requestReset()
{
    return requestControl(ControlCommand::Reset, [](Engine &engine) { engine.reset(); }, QString());
}

RequestResult AsyncBridge::requestControl(ControlCommand command, std::function<void(Engine &)> call,
                                          const QString &detail)
{
    const QString name = to_string(command);
    if (m_shutDown)
        return reject(RequestStatus::ShuttingDown, name + " rejected: bridge is shut down");
    if (m_pendingControl) {
        return reject(RequestStatus::Busy, QString("%1 rejected: %2 is still in progress")
                                               .arg(name, to_string(m_pendingControl->command)));
    }
    if (m_controlInEngine) {
        return reject(RequestStatus::Busy,
                      QString("%1 rejected: a timed-out control call has not returned from the engine yet").arg(name));
    }
    if (!m_machine.can_apply(command)) {
        return reject(RequestStatus::InvalidTransition,
                      QString("%1 is not allowed in state %2").arg(name, to_string(m_machine.state())));
    }

    PendingOperation op;
    op.sequence = m_nextSequence++;
    op.kind = OperationKind::Control;
    op.command = command;
    op.detail = detail;
    m_pendingControl = op;
    m_controlInEngine = op.sequence;
    ++m_controlEpoch;
    if (command == ControlCommand::Reset)
        ++m_watchGeneration;

    appendLog(LogSource::App, log::Level::Info,
              detail.isEmpty() ? QString("%1...").arg(name) : QString("%1 %2...").arg(name, detail));
    emit controlPendingChanged(true);

    const uint64_t sequence = op.sequence;
    std::shared_ptr<Engine> engine = m_engine;
    dispatch([engine, call] { call(*engine); },
             [this, sequence, command](std::future<void> &result) { finishControl(sequence, command, result); });

    if (m_options.call_timeout.count() > 0) {
        QTimer::singleShot(m_options.call_timeout, this, [this, sequence] { controlTimedOut(sequence); });
    }
    return RequestResult{};
}

void AsyncBridge::finishControl(uint64_t sequence, ControlCommand command, std::future<void> &result)
{
    std::optional<QString> failure = failureOf(result);
    if (m_controlInEngine == sequence)
        m_controlInEngine.reset();
    if (!m_pendingControl || m_pendingControl->sequence != sequence) {
        log::debug(QString("discarding late %1 result").arg(to_string(command)).toStdString());
        return;
    }
    m_pendingControl.reset();

    if (failure) {
        failState(QString("%1 failed: %2").arg(to_string(command), *failure));
    } else if (m_machine.complete(command)) {
        appendLog(LogSource::App, log::Level::Info,
                  QString("%1 done, state is now %2").arg(to_string(command), to_string(m_machine.state())));
    } else {
        failState(QString("%1 completed but is not valid from state %2")
                      .arg(to_string(command), to_string(m_machine.state())));
    }

    emit controlPendingChanged(false);
    emit stateChanged(m_machine.state(), lastError());
    updatePolling();
}

void AsyncBridge::controlTimedOut(uint64_t sequence)
{
    if (!m_pendingControl || m_pendingControl->sequence != sequence)
        return;
    const ControlCommand command = m_pendingControl->command;
    m_pendingControl.reset();
    failState(QString("%1 timed out after %2 ms")
                  .arg(to_string(command))
                  .arg(m_options.call_timeout.count()));
    emit controlPendingChanged(false);
    emit stateChanged(m_machine.state(), lastError());
    updatePolling();
}

void AsyncBridge::failState(const QString &error)
{
    m_machine.fail(error.toStdString());
    appendLog(LogSource::App, log::Level::Error, error);
}

RequestResult AsyncBridge::requestMonitorCommand(const QString &command)
{
    const QString text = command.trimmed();
    if (m_shutDown)
        return reject(RequestStatus::ShuttingDown, "monitor command rejected: bridge is shut down");
    if (text.isEmpty())
        return reject(RequestStatus::InvalidInput, "monitor command is empty");
    if (m_machine.state() == SimulationState::Idle)
        return reject(RequestStatus::InvalidTransition, "monitor commands need a loaded script");

    m_monitorQueue.push_back(text);
    startNextMonitorCommand();
    return RequestResult{};
}

void AsyncBridge::startNextMonitorCommand()
{
    if (m_shutDown || m_pendingMonitor || m_monitorInEngine || m_monitorQueue.empty())
        return;

    PendingOperation op;
    op.sequence = m_nextSequence++;
    op.kind = OperationKind::Monitor;
    op.detail = m_monitorQueue.front();
    m_monitorQueue.pop_front();
    m_pendingMonitor = op;
    m_monitorInEngine = op.sequence;

    appendLog(LogSource::Monitor, log::Level::Info, "> " + op.detail);

    const uint64_t sequence = op.sequence;
    std::shared_ptr<Engine> engine = m_engine;
    dispatch([engine, text = op.detail.toStdString()] { return engine->send_monitor_command(text); },
             [this, sequence](std::future<std::string> &result) { finishMonitorCommand(sequence, result); });

    if (m_options.call_timeout.count() > 0) {
        QTimer::singleShot(m_options.call_timeout, this, [this, sequence] { monitorTimedOut(sequence); });
    }
}

void AsyncBridge::finishMonitorCommand(uint64_t sequence, std::future<std::string> &result)
{
    std::string output;
    std::optional<QString> failure = failureOf(result, &output);
    if (m_monitorInEngine == sequence)
        m_monitorInEngine.reset();
    if (!m_pendingMonitor || m_pendingMonitor->sequence != sequence) {
        // Timed out earlier; the queue was held until now.
        startNextMonitorCommand();
        return;
    }
    m_pendingMonitor.reset();

    if (failure)
        appendLog(LogSource::Monitor, log::Level::Error, "error: " + *failure);
    else if (!output.empty())
        appendLog(LogSource::Monitor, log::Level::Info, QString::fromStdString(output));

    startNextMonitorCommand();
}

void AsyncBridge::monitorTimedOut(uint64_t sequence)
{
    if (!m_pendingMonitor || m_pendingMonitor->sequence != sequence)
        return;
    const QString text = m_pendingMonitor->detail;
    m_pendingMonitor.reset();
    appendLog(LogSource::Monitor, log::Level::Error,
              QString("error: '%1' timed out after %2 ms").arg(text).arg(m_options.call_timeout.count()));
}

RequestResult AsyncBridge::addWatch(const QString &address, const QString &name, DataType type)
{
    if (m_shutDown)
        return reject(RequestStatus::ShuttingDown, "watch rejected: bridge is shut down");

    const auto parsed = parse_address(address.toStdString());
    if (!parsed) {
        return reject(RequestStatus::InvalidInput,
                      QString("invalid address '%1': expected 0x-prefixed hex").arg(address));
    }

    const QString trimmed = name.trimmed();
    const auto added = m_watches.add(*parsed, trimmed.toStdString(), type);
    if (!added.ok()) {
        return reject(RequestStatus::InvalidInput,
                      QString("cannot add watch '%1': %2").arg(trimmed, to_string(added.error)));
    }

    appendLog(LogSource::App, log::Level::Info,
              QString("watching %1 at %2 as %3")
                  .arg(trimmed, QString::fromStdString(format_address(*parsed)), data_type_name(type)));
    emit watchAdded(trimmed);
    return RequestResult{};
}

bool AsyncBridge::removeWatch(const QString &name)
{
    if (!m_watches.remove(name.toStdString()))
        return false;
    appendLog(LogSource::App, log::Level::Info, QString("stopped watching %1").arg(name));
    emit watchRemoved(name);
    return true;
}

bool AsyncBridge::isPolling() const
{
    return m_pollTimer->isActive();
}

void AsyncBridge::setPollInterval(std::chrono::milliseconds interval)
{
    m_options.poll_interval = interval;
    m_pollTimer->setInterval(static_cast<int>(interval.count()));
}

void AsyncBridge::updatePolling()
{
    const bool shouldPoll = !m_shutDown && m_machine.state() == SimulationState::Running;
    if (shouldPoll && !m_pollTimer->isActive()) {
        m_pollTimer->start();
        log::debug("watch polling resumed");
    } else if (!shouldPoll && m_pollTimer->isActive()) {
        m_pollTimer->stop();
        log::debug("watch polling suspended");
    }
}

bool AsyncBridge::pollNow()
{
    if (m_shutDown || m_machine.state() != SimulationState::Running)
        return false;
    pollWatches();
    return true;
}

void AsyncBridge::pollWatches()
{
    if (m_shutDown || m_machine.state() != SimulationState::Running)
        return;
    ++m_pollCycles;

    std::shared_ptr<Engine> engine = m_engine;
    const uint64_t generation = m_watchGeneration;
    for (const MemoryWatch &watch : m_watches.entries()) {
        // A read that has not come back yet is not queued behind.
        if (!m_watches.begin_read(watch.id)) {
            ++m_skippedReads;
            continue;
        }
        const uint64_t id = watch.id;
        const uint64_t address = watch.address;
        const DataType type = watch.type;
        dispatch([engine, address, type] { return engine->read_memory(address, type); },
                 [this, id, generation](std::future<ScalarValue> &result) { finishRead(id, generation, result); });
    }

    if (!m_statusProbeInFlight) {
        m_statusProbeInFlight = true;
        const uint64_t epoch = m_controlEpoch;
        dispatch([engine] { return engine->is_running(); },
                 [this, epoch](std::future<bool> &result) { finishStatusProbe(epoch, result); });
    }
}

void AsyncBridge::finishRead(uint64_t watchId, uint64_t generation, std::future<ScalarValue> &result)
{
    ScalarValue value;
    std::optional<QString> failure = failureOf(result, &value);

    const MemoryWatch *watch = m_watches.find(watchId);
    if (!watch)
        return;
    if (generation != m_watchGeneration) {
        m_watches.cancel_read(watchId);
        return;
    }

    if (failure) {
        m_watches.record_error(watchId, failure->toStdString());
        log::debug(QString("read of %1 failed: %2").arg(QString::fromStdString(watch->name), *failure).toStdString());
    } else {
        m_watches.record_value(watchId, value);
    }
    emit watchUpdated(QString::fromStdString(watch->name));
}

void AsyncBridge::finishStatusProbe(uint64_t epoch, std::future<bool> &result)
{
    m_statusProbeInFlight = false;
    bool running = false;
    std::optional<QString> failure = failureOf(result, &running);

    // Anything a control command changed since the probe was sent wins.
    if (m_shutDown || epoch != m_controlEpoch || m_pendingControl || m_machine.state() != SimulationState::Running)
        return;

    if (failure) {
        failState(QString("engine status check failed: %1").arg(*failure));
    } else if (!running && m_machine.engine_stopped()) {
        appendLog(LogSource::App, log::Level::Warn, "engine reports the simulation has stopped");
    } else {
        return;
    }
    emit stateChanged(m_machine.state(), lastError());
    updatePolling();
}

void AsyncBridge::shutdown()
{
    if (m_shutDown)
        return;
    m_shutDown = true;
    m_pollTimer->stop();
    m_sink->close();
    m_engine->set_log_handler({});
    m_monitorQueue.clear();
    m_dispatcher->shutdown(m_options.shutdown_grace);
    log::info("bridge shut down");
}

void AsyncBridge::appendLog(LogSource source, log::Level level, const QString &text)
{
    LogEntry entry;
    entry.timestamp = QDateTime::currentDateTime();
    entry.source = source;
    entry.level = level;
    entry.text = text;

    if (source == LogSource::App) {
        log::write(level, text.toStdString());
        m_appLog.push_back(entry);
    } else {
        log::debug("[monitor] " + text.toStdString());
        m_monitorLog.push_back(entry);
    }
    emit logAppended(entry);
}

RequestResult AsyncBridge::reject(RequestStatus status, const QString &message)
{
    appendLog(LogSource::App, log::Level::Warn, message);
    emit requestRejected(message);
    return RequestResult{status, message};
}

} // namespace SimShell
