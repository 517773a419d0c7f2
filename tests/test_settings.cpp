#include "core/settings.h"
#include "test_harness.h"
#include <QSettings>
#include <QTemporaryDir>

using namespace SimShell;

static QStringList argv_of(std::initializer_list<const char*> args){
    QStringList list{"simshell"};
    for(const char* a : args) list << a;
    return list;
}

static void test_defaults_and_store(const QString& dir){
    QSettings store(dir + "/simshell.ini", QSettings::IniFormat);
    Settings s;
    s.load(store);
    EXPECT_TRUE(s.backend == Settings::Backend::Mock);
    EXPECT_EQ(s.poll_interval_ms, 500);
    EXPECT_EQ(s.workers, 2);
    EXPECT_EQ(s.call_timeout_ms, 0);

    s.backend = Settings::Backend::Renode;
    s.host = "10.0.0.5";
    s.port = 4321;
    s.poll_interval_ms = 250;
    s.log_level = log::Level::Debug;
    s.save(store);
    store.sync();

    Settings reloaded;
    reloaded.load(store);
    EXPECT_TRUE(reloaded.backend == Settings::Backend::Renode);
    EXPECT_EQ(reloaded.host, std::string("10.0.0.5"));
    EXPECT_EQ(reloaded.port, uint16_t{4321});
    EXPECT_EQ(reloaded.poll_interval_ms, 250);
    EXPECT_TRUE(reloaded.log_level == log::Level::Debug);
}

static void test_clamping(const QString& dir){
    QSettings store(dir + "/clamp.ini", QSettings::IniFormat);
    store.setValue("poll/intervalMs", 1);
    store.setValue("engine/workers", 0);
    store.setValue("engine/callTimeoutMs", -20);
    Settings s;
    s.load(store);
    EXPECT_EQ(s.poll_interval_ms, 50);
    EXPECT_EQ(s.workers, 1);
    EXPECT_EQ(s.call_timeout_ms, 0);
}

static void test_environment(){
    qputenv("SIMSHELL_BACKEND", "renode");
    qputenv("SIMSHELL_MONITOR", "sim.local:5555");
    Settings s;
    s.apply_environment();
    EXPECT_TRUE(s.backend == Settings::Backend::Renode);
    EXPECT_EQ(s.host, std::string("sim.local"));
    EXPECT_EQ(s.port, uint16_t{5555});

    qputenv("SIMSHELL_BACKEND", "qemu");
    qputenv("SIMSHELL_MONITOR", "nohostport");
    Settings untouched;
    untouched.apply_environment();
    EXPECT_TRUE(untouched.backend == Settings::Backend::Mock);
    EXPECT_EQ(untouched.port, uint16_t{1234});
    qunsetenv("SIMSHELL_BACKEND");
    qunsetenv("SIMSHELL_MONITOR");
}

static void test_arguments(){
    Settings s;
    QString error;
    EXPECT_TRUE(s.apply_arguments(argv_of({"--backend", "renode", "--port", "2000", "--poll-interval", "100",
                                           "--script", "boards/demo.resc", "--cli", "--log-level", "warn"}), error));
    EXPECT_TRUE(s.backend == Settings::Backend::Renode);
    EXPECT_EQ(s.port, uint16_t{2000});
    EXPECT_EQ(s.poll_interval_ms, 100);
    EXPECT_EQ(s.startup_script, std::string("boards/demo.resc"));
    EXPECT_TRUE(s.cli);
    EXPECT_TRUE(s.log_level == log::Level::Warn);

    Settings bad;
    EXPECT_FALSE(bad.apply_arguments(argv_of({"--backend", "qemu"}), error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(bad.apply_arguments(argv_of({"--port", "70000"}), error));
    EXPECT_FALSE(bad.apply_arguments(argv_of({"--workers", "many"}), error));
    EXPECT_FALSE(bad.apply_arguments(argv_of({"--no-such-flag"}), error));

    Settings help;
    EXPECT_TRUE(help.apply_arguments(argv_of({"--help"}), error));
    EXPECT_TRUE(help.show_help);
    EXPECT_TRUE(help.help_text.contains("--poll-interval"));
}

static void test_endpoint(){
    std::string host;
    uint16_t port = 0;
    EXPECT_TRUE(parse_endpoint("localhost:1234", host, port));
    EXPECT_EQ(host, std::string("localhost"));
    EXPECT_EQ(port, uint16_t{1234});
    EXPECT_FALSE(parse_endpoint(":1234", host, port));
    EXPECT_FALSE(parse_endpoint("localhost:0", host, port));
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    QTemporaryDir dir;
    if(!dir.isValid()){
        std::cerr<<"cannot create temporary directory"<<std::endl;
        return 2;
    }
    test_defaults_and_store(dir.path());
    test_clamping(dir.path());
    test_environment();
    test_arguments();
    test_endpoint();
    return finish("settings");
}
