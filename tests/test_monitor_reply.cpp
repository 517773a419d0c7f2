#include "engine/engine.h"
#include "engine/monitor_reply.h"
#include "test_harness.h"

using namespace SimShell;

static void test_plain_reply(){
    auto r = parse_monitor_reply("sysbus ReadDoubleWord 0x80001000\r\n0x001000A4\r\n(machine-0) ", "sysbus ReadDoubleWord 0x80001000");
    EXPECT_EQ(r.text, std::string("0x001000A4"));
    EXPECT_FALSE(r.is_error);
}

static void test_echo_after_prompt(){
    auto r = parse_monitor_reply("(monitor) help\nline one\nline two\n(monitor) ", "help");
    EXPECT_EQ(r.text, std::string("line one\nline two"));
}

static void test_error_detection(){
    auto red = parse_monitor_reply("bogus\n\x1b[31mCould not find bogus\x1b[0m\n(monitor) ", "bogus");
    EXPECT_TRUE(red.is_error);
    EXPECT_EQ(red.text, std::string("Could not find bogus"));

    auto plain = parse_monitor_reply("include @x\nThere was an error executing command\n(monitor) ", "include @x");
    EXPECT_TRUE(plain.is_error);
}

static void test_telnet_and_prompt(){
    std::string raw = "\xff\xfb\x01hello\xff\xff";
    EXPECT_EQ(strip_telnet(raw), std::string("hello\xff"));
    EXPECT_TRUE(ends_with_prompt("output\n(machine-0) "));
    EXPECT_TRUE(ends_with_prompt("\x1b[32m(monitor)\x1b[0m "));
    EXPECT_FALSE(ends_with_prompt("output\n(machine-0)"));
    EXPECT_FALSE(ends_with_prompt("still printing "));
    EXPECT_EQ(strip_ansi("\x1b[1;31mred\x1b[0m\r"), std::string("red"));
}

static void test_bus_value(){
    EXPECT_EQ(parse_bus_value("0x001000A4"), 0x1000A4ULL);
    EXPECT_EQ(parse_bus_value("  42 \n"), 42ULL);
    EXPECT_THROWS(parse_bus_value(""));
    EXPECT_THROWS(parse_bus_value("Could not find"));
}

static void test_status_reply(){
    EXPECT_TRUE(parse_bool_reply("True"));
    EXPECT_FALSE(parse_bool_reply(" false \n"));
    EXPECT_THROWS(parse_bool_reply("Could not find emulation"));
    EXPECT_THROWS(parse_bool_reply(""));
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    test_plain_reply();
    test_echo_after_prompt();
    test_error_detection();
    test_telnet_and_prompt();
    test_bus_value();
    test_status_reply();
    return finish("monitor_reply");
}
