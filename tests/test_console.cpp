#include "bridge/async_bridge.h"
#include "console.h"
#include "fake_engine.h"
#include "test_harness.h"

using namespace SimShell;
using namespace std::chrono_literals;

static AsyncBridge::Options manual_polling(){
    AsyncBridge::Options o;
    o.poll_interval = 60000ms;
    o.shutdown_grace = 500ms;
    return o;
}

static void test_pasted_lines_all_run(){
    auto engine = std::make_shared<FakeEngine>();
    AsyncBridge bridge(engine, manual_polling());
    Console console(bridge);

    // One read delivering several lines at once.
    EXPECT_TRUE(console.feed("watch 0x80000000 ram uint32\nwatch 0x80000004 ram2\r\nload demo.resc\n"));
    EXPECT_EQ(bridge.watches().size(), size_t{2});
    EXPECT_TRUE(bridge.isControlPending());
    EXPECT_TRUE(wait_until([&]{ return bridge.state() == SimulationState::Loaded; }));
    EXPECT_EQ(engine->calls("load"), 1);
}

static void test_partial_line_waits(){
    auto engine = std::make_shared<FakeEngine>();
    AsyncBridge bridge(engine, manual_polling());
    Console console(bridge);

    EXPECT_TRUE(console.feed("watch 0x8000"));
    EXPECT_TRUE(bridge.watches().empty());
    EXPECT_TRUE(console.feed("0000 pc\n"));
    EXPECT_TRUE(bridge.watches().find(std::string("pc")) != nullptr);
}

static void test_quit_stops_remaining_lines(){
    auto engine = std::make_shared<FakeEngine>();
    AsyncBridge bridge(engine, manual_polling());
    Console console(bridge);

    EXPECT_FALSE(console.feed("quit\nload demo.resc\n"));
    drain(20);
    EXPECT_EQ(engine->calls("load"), 0);
    EXPECT_FALSE(bridge.isControlPending());
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    test_pasted_lines_all_run();
    test_partial_line_waits();
    test_quit_stops_remaining_lines();
    return finish("console");
}
