#include "bridge/watch_registry.h"
#include "test_harness.h"

using namespace SimShell;

static void test_add_in_order(){
    WatchRegistry reg;
    auto a = reg.add(0x80001000, "pc", DataType::UInt32);
    auto b = reg.add(0x80002000, "sp", DataType::UInt64);
    EXPECT_TRUE(a.ok());
    EXPECT_TRUE(b.ok());
    EXPECT_TRUE(a.id != b.id);
    EXPECT_EQ(reg.size(), size_t{2});
    EXPECT_EQ(reg.entries()[0].name, std::string("pc"));
    EXPECT_EQ(reg.entries()[1].name, std::string("sp"));
    EXPECT_EQ(reg.entries()[0].display_value(), std::string("-"));
}

static void test_add_rejections(){
    WatchRegistry reg;
    EXPECT_TRUE(reg.add(0x10, "", DataType::UInt8).error == WatchRegistry::AddError::EmptyName);
    EXPECT_TRUE(reg.add(0x10, "x", DataType::UInt8).ok());
    EXPECT_TRUE(reg.add(0x20, "x", DataType::UInt8).error == WatchRegistry::AddError::DuplicateName);
    EXPECT_TRUE(reg.add(0xFFFFFFFFFFFFFFFDULL, "hi", DataType::UInt32).error == WatchRegistry::AddError::AddressOverflow);
    EXPECT_TRUE(reg.add(0xFFFFFFFFFFFFFFFFULL, "top", DataType::UInt8).ok());
    EXPECT_EQ(reg.size(), size_t{2});
}

static void test_values_and_errors(){
    WatchRegistry reg;
    uint64_t id = reg.add(0x80001000, "pc", DataType::UInt32).id;

    EXPECT_TRUE(reg.begin_read(id));
    EXPECT_FALSE(reg.begin_read(id));
    EXPECT_TRUE(reg.record_value(id, ScalarValue{uint64_t{0x1000A4}}));
    const MemoryWatch* w = reg.find(id);
    EXPECT_FALSE(w->read_in_flight);
    EXPECT_EQ(w->display_value(), std::string("0x001000A4"));

    // A failed read keeps showing the previous value.
    EXPECT_TRUE(reg.begin_read(id));
    EXPECT_TRUE(reg.record_error(id, "unmapped"));
    EXPECT_EQ(w->display_value(), std::string("0x001000A4"));
    EXPECT_EQ(*w->last_error, std::string("unmapped"));
    EXPECT_EQ(w->read_count, uint64_t{2});
    EXPECT_EQ(w->failure_count, uint64_t{1});

    EXPECT_TRUE(reg.begin_read(id));
    EXPECT_TRUE(reg.record_value(id, ScalarValue{uint64_t{7}}));
    EXPECT_FALSE(w->last_error.has_value());

    EXPECT_TRUE(reg.begin_read(id));
    EXPECT_TRUE(reg.cancel_read(id));
    EXPECT_FALSE(w->read_in_flight);
    EXPECT_EQ(w->read_count, uint64_t{3});
}

static void test_remove(){
    WatchRegistry reg;
    uint64_t id = reg.add(0x80001000, "pc", DataType::UInt32).id;
    EXPECT_TRUE(reg.begin_read(id));
    EXPECT_TRUE(reg.remove("pc"));
    EXPECT_FALSE(reg.remove("pc"));
    EXPECT_TRUE(reg.find(id) == nullptr);
    // Results for a removed watch go nowhere.
    EXPECT_FALSE(reg.record_value(id, ScalarValue{uint64_t{1}}));
    EXPECT_FALSE(reg.record_error(id, "late"));
    EXPECT_TRUE(reg.add(0x80001000, "pc", DataType::UInt32).ok());
    reg.clear();
    EXPECT_TRUE(reg.empty());
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    test_add_in_order();
    test_add_rejections();
    test_values_and_errors();
    test_remove();
    return finish("watch_registry");
}
