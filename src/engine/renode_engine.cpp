#include "renode_engine.h"
#include "monitor_reply.h"
#include "core/logger.h"
#include <QElapsedTimer>
#include <QObject>
#include <QTcpSocket>
#include <QThread>
#include <exception>

namespace SimShell {

namespace {
const char* read_command(size_t width){
    switch(width){
        case 1: return "ReadByte";
        case 2: return "ReadWord";
        case 4: return "ReadDoubleWord";
        default: return "ReadQuadWord";
    }
}
}

// Owns the socket. Lives on RenodeEngine::thread_ and is only touched there.
class RenodeEngine::Connection : public QObject {
public:
    Connection(const Endpoint& endpoint, RenodeEngine* engine)
        : m_endpoint(endpoint), m_engine(engine) {}

    std::string execute(const std::string& command){
        ensureConnected();
        m_socket->readAll(); // drop anything unsolicited

        QByteArray line = QByteArray::fromStdString(command);
        line.append('\n');
        m_socket->write(line);
        if(!m_socket->waitForBytesWritten(timeoutMs())){
            drop();
            throw EngineError("monitor write failed: " + m_lastError);
        }

        std::string raw = readUntilPrompt();
        MonitorReply reply = parse_monitor_reply(raw, command);
        if(reply.is_error) throw EngineError(reply.text.empty() ? "command failed: " + command : reply.text);
        return reply.text;
    }

private:
    int timeoutMs() const { return static_cast<int>(m_endpoint.io_timeout.count()); }

    void ensureConnected(){
        if(m_socket && m_socket->state() == QAbstractSocket::ConnectedState) return;
        drop();
        m_socket = new QTcpSocket(this);
        m_socket->connectToHost(QString::fromStdString(m_endpoint.host), m_endpoint.port);
        if(!m_socket->waitForConnected(timeoutMs())){
            m_lastError = m_socket->errorString().toStdString();
            drop();
            throw EngineError("cannot reach monitor at " + m_endpoint.host + ":" +
                              std::to_string(m_endpoint.port) + ": " + m_lastError);
        }
        // Banner and telnet negotiation end with the first prompt.
        readUntilPrompt();
        m_engine->emit_log("Connected to monitor at " + m_endpoint.host + ":" + std::to_string(m_endpoint.port));
    }

    std::string readUntilPrompt(){
        std::string raw;
        QElapsedTimer timer;
        timer.start();
        while(!ends_with_prompt(raw)){
            qint64 left = m_endpoint.io_timeout.count() - timer.elapsed();
            if(left <= 0 || !m_socket->waitForReadyRead(static_cast<int>(left))){
                m_lastError = m_socket->errorString().toStdString();
                drop();
                throw EngineError("monitor did not answer: " + m_lastError);
            }
            raw += m_socket->readAll().toStdString();
        }
        return raw;
    }

    void drop(){
        if(!m_socket) return;
        m_socket->abort();
        m_socket->deleteLater();
        m_socket = nullptr;
    }

    Endpoint m_endpoint;
    RenodeEngine* m_engine;
    QTcpSocket* m_socket{nullptr};
    std::string m_lastError;
};

RenodeEngine::RenodeEngine(Endpoint endpoint)
    : endpoint_(std::move(endpoint))
    , thread_(std::make_unique<QThread>())
{
    thread_->setObjectName("renode-monitor");
    connection_ = new Connection(endpoint_, this);
    connection_->moveToThread(thread_.get());
    QObject::connect(thread_.get(), &QThread::finished, connection_, &QObject::deleteLater);
    thread_->start();
    log::info("RenodeEngine initialized for " + endpoint_.host + ":" + std::to_string(endpoint_.port));
}

RenodeEngine::~RenodeEngine(){
    thread_->quit();
    thread_->wait();
}

std::string RenodeEngine::execute(const std::string& command){
    std::lock_guard<std::mutex> lock(exec_mtx_);
    log::debug("monitor> " + command);

    std::string reply;
    std::exception_ptr failure;
    Connection* conn = connection_;
    bool invoked = QMetaObject::invokeMethod(conn, [&]{
        try {
            reply = conn->execute(command);
        } catch(...) {
            failure = std::current_exception();
        }
    }, Qt::BlockingQueuedConnection);

    if(!invoked) throw EngineError("monitor connection thread is not available");
    if(failure) std::rethrow_exception(failure);
    return reply;
}

void RenodeEngine::load_script(const std::string& path){
    log::info("Loading script: " + path);
    execute("Clear");
    if(path.find(' ') != std::string::npos) execute("include @\"" + path + "\"");
    else execute("include @" + path);
    emit_log("Script loaded: " + path);
}

void RenodeEngine::start(){
    execute("start");
    emit_log("Simulation started");
}

void RenodeEngine::pause(){
    execute("pause");
    emit_log("Simulation paused");
}

void RenodeEngine::reset(){
    execute("Clear");
    emit_log("Simulation reset");
}

ScalarValue RenodeEngine::read_memory(uint64_t address, DataType type){
    const size_t width = data_type_width(type);
    std::string reply = execute(std::string("sysbus ") + read_command(width) + " " + format_address(address));
    return decode_scalar(type, parse_bus_value(reply));
}

std::string RenodeEngine::send_monitor_command(const std::string& text){
    return execute(text);
}

bool RenodeEngine::is_running(){
    return parse_bool_reply(execute("emulation IsStarted"));
}

void RenodeEngine::set_log_handler(LogHandler handler){
    std::lock_guard<std::mutex> lock(handler_mtx_);
    log_handler_ = std::move(handler);
}

void RenodeEngine::emit_log(const std::string& line){
    LogHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mtx_);
        handler = log_handler_;
    }
    log::info(line);
    if(handler) handler(line);
}

} // namespace SimShell
