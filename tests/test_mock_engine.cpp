#include "engine/mock_engine.h"
#include "test_harness.h"
#include <vector>

using namespace SimShell;

static MockEngine::Timing instant(){
    MockEngine::Timing t;
    t.load = t.start = t.pause = t.reset = t.read = t.monitor = std::chrono::milliseconds(0);
    return t;
}

static void test_lifecycle(){
    MockEngine engine(instant());
    std::vector<std::string> lines;
    engine.set_log_handler([&](const std::string& line){ lines.push_back(line); });

    EXPECT_THROWS(engine.start());
    EXPECT_THROWS(engine.load_script(""));
    engine.load_script("demo.resc");
    EXPECT_FALSE(engine.is_running());
    engine.start();
    EXPECT_TRUE(engine.is_running());
    engine.pause();
    EXPECT_FALSE(engine.is_running());
    engine.start();
    engine.reset();
    EXPECT_FALSE(engine.is_running());
    EXPECT_THROWS(engine.start());

    EXPECT_TRUE(!lines.empty());
    EXPECT_EQ(lines.front(), std::string("Script loaded: demo.resc"));
    EXPECT_EQ(engine.name(), std::string("mock"));
}

static void test_memory_reads(){
    MockEngine engine(instant());
    EXPECT_EQ(std::get<uint64_t>(engine.read_memory(MockEngine::kRamBase, DataType::UInt32)), 0xDEADBEEFULL);
    EXPECT_EQ(std::get<uint64_t>(engine.read_memory(MockEngine::kRamBase, DataType::UInt8)), 0xEFULL);
    EXPECT_EQ(std::get<int64_t>(engine.read_memory(MockEngine::kRamBase, DataType::Int32)), int64_t{-559038737});

    bool unmapped = false;
    try {
        engine.read_memory(0x1000, DataType::UInt32);
    } catch(const EngineError& e) {
        unmapped = std::string(e.what()) == "unmapped";
    }
    EXPECT_TRUE(unmapped);
    // Straddling the end of the window is also unmapped.
    EXPECT_THROWS(engine.read_memory(MockEngine::kRamBase + MockEngine::kRamSize - 2, DataType::UInt32));
}

static void test_monitor_commands(){
    MockEngine engine(instant());
    EXPECT_TRUE(engine.send_monitor_command("help").find("sysbus") != std::string::npos);
    EXPECT_EQ(engine.send_monitor_command("sysbus WriteDoubleWord 0x80000010 0x1234"), std::string(""));
    EXPECT_EQ(engine.send_monitor_command("sysbus ReadDoubleWord 0x80000010"), std::string("0x00001234"));
    EXPECT_EQ(std::get<uint64_t>(engine.read_memory(0x80000010, DataType::UInt16)), 0x1234ULL);
    EXPECT_THROWS(engine.send_monitor_command("sysbus ReadDoubleWord 0x10"));
    EXPECT_THROWS(engine.send_monitor_command("sysbus ReadDoubleWord nope"));

    bool unknown = false;
    try {
        engine.send_monitor_command("frobnicate now");
    } catch(const EngineError& e) {
        unknown = std::string(e.what()) == "Unknown command: frobnicate";
    }
    EXPECT_TRUE(unknown);

    // Reset restores the fill pattern.
    engine.reset();
    EXPECT_EQ(engine.send_monitor_command("sysbus ReadDoubleWord 0x80000010"), std::string("0xDEADBEEF"));
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    test_lifecycle();
    test_memory_reads();
    test_monitor_commands();
    return finish("mock_engine");
}
