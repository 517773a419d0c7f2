#include "engine/data_type.h"
#include "test_harness.h"

using namespace SimShell;

static void test_parse_address(){
    EXPECT_EQ(*parse_address("0x80001000"), 0x80001000ULL);
    EXPECT_EQ(*parse_address("0X1f"), 0x1FULL);
    EXPECT_EQ(*parse_address("  0xFFFFFFFFFFFFFFFF "), 0xFFFFFFFFFFFFFFFFULL);
    EXPECT_FALSE(parse_address("").has_value());
    EXPECT_FALSE(parse_address("0x").has_value());
    EXPECT_FALSE(parse_address("80001000").has_value());
    EXPECT_FALSE(parse_address("0x8000g000").has_value());
    EXPECT_FALSE(parse_address("0x10000000000000000").has_value());
    EXPECT_FALSE(parse_address("-0x10").has_value());
    EXPECT_EQ(format_address(0x1000), std::string("0x00001000"));
}

static void test_parse_type_names(){
    EXPECT_TRUE(parse_data_type("uint32") == DataType::UInt32);
    EXPECT_TRUE(parse_data_type("Float64") == DataType::Float64);
    EXPECT_TRUE(parse_data_type("Byte") == DataType::UInt8);
    EXPECT_TRUE(parse_data_type("HalfWord") == DataType::UInt16);
    EXPECT_TRUE(parse_data_type("DoubleWord") == DataType::UInt32);
    EXPECT_TRUE(parse_data_type("QuadWord") == DataType::UInt64);
    EXPECT_FALSE(parse_data_type("uint128").has_value());
    EXPECT_EQ(data_type_width(DataType::Int16), size_t{2});
    EXPECT_EQ(data_type_width(DataType::Float64), size_t{8});
}

static void test_decode(){
    EXPECT_EQ(std::get<uint64_t>(decode_scalar(DataType::UInt8, 0x1FF)), 0xFFULL);
    EXPECT_EQ(std::get<int64_t>(decode_scalar(DataType::Int8, 0xFF)), int64_t{-1});
    EXPECT_EQ(std::get<int64_t>(decode_scalar(DataType::Int16, 0x8000)), int64_t{-32768});
    EXPECT_EQ(std::get<int64_t>(decode_scalar(DataType::Int32, 0xDEADBEEF)), int64_t{-559038737});
    EXPECT_EQ(std::get<double>(decode_scalar(DataType::Float32, 0x3FC00000)), 1.5);
    EXPECT_EQ(std::get<double>(decode_scalar(DataType::Float64, 0xC000000000000000ULL)), -2.0);
}

static void test_format(){
    EXPECT_EQ(format_scalar(uint64_t{0x1000A4}, DataType::UInt32), std::string("0x001000A4"));
    EXPECT_EQ(format_scalar(uint64_t{0xAB}, DataType::UInt8), std::string("0xAB"));
    EXPECT_EQ(format_scalar(int64_t{-5}, DataType::Int16), std::string("-5"));
    EXPECT_EQ(format_scalar(1.5, DataType::Float32), std::string("1.5"));
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    test_parse_address();
    test_parse_type_names();
    test_decode();
    test_format();
    return finish("data_type");
}
