#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "sccplib/proto/dt1.hpp"
#include "sccplib/proto/message.hpp"
#include "sccplib/proto/udt.hpp"
#include "sccplib/utils/log_config.hpp"

using namespace sccplib;
using namespace sccplib::proto;

class ParseMessageTest : public ::testing::Test {
protected:
    void SetUp() override {}

    void TearDown() override {
        auto& mgr = utils::LogManager::instance();
        mgr.clear_global_sinks();
        mgr.set_global_level(utils::LogLevel::Info);
    }

    const std::vector<uint8_t> dt1_ = {0x06, 0x01, 0x02, 0x03, 0x00, 0x01, 0x02, 0xAA, 0xBB};
    // Outlives the sinks removed in TearDown.
    std::ostringstream captured_;
};

// Dispatch yields the same message as decoding DT1 directly
TEST_F(ParseMessageTest, DispatchesDT1) {
    auto res = parse_message(dt1_);
    ASSERT_TRUE(res.has_value()) << res.error().message();

    const auto& msg = res.value();
    EXPECT_EQ(msg->message_type(), MessageType::DT1);
    EXPECT_EQ(msg->message_type_name(), "DT1");

    auto* d = dynamic_cast<const DT1*>(msg.get());
    ASSERT_NE(d, nullptr);
    auto direct = DT1::parse(dt1_);
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(*d, direct.value());
}

TEST_F(ParseMessageTest, DispatchesUDT) {
    UDT original(ProtocolClass::make(0, false),
                 PartyAddress::create(std::nullopt, 0x08),
                 PartyAddress::create(0x0203, 0x08),
                 {0x01, 0x02});
    auto encoded = original.marshal_binary();
    ASSERT_TRUE(encoded.has_value());

    auto res = parse_message(encoded.value());
    ASSERT_TRUE(res.has_value()) << res.error().message();
    auto* u = dynamic_cast<const UDT*>(res.value().get());
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(*u, original);
}

// Known tags without a codec are reported with the exact tag
TEST_F(ParseMessageTest, ReservedTypesUnsupported) {
    for (int raw = kFirstMessageType; raw <= kLastMessageType; ++raw) {
        if (raw == 0x06 || raw == 0x09) continue;
        std::vector<uint8_t> bytes = {static_cast<uint8_t>(raw), 0x00, 0x00, 0x00, 0x00, 0x01, 0x00};
        auto res = parse_message(bytes);
        ASSERT_FALSE(res.has_value()) << raw;
        EXPECT_EQ(res.error().code, make_error_code(SccpErrc::unimplemented_type));
        EXPECT_TRUE(res.error().code == SccpCondition::unsupported_type);
        EXPECT_EQ(res.error().type, raw);
    }
}

TEST_F(ParseMessageTest, UnknownTypesUnsupported) {
    for (uint8_t raw : {uint8_t{0x00}, uint8_t{0x15}, uint8_t{0x80}, uint8_t{0xFF}}) {
        std::vector<uint8_t> bytes = {raw, 0x01, 0x02};
        auto res = parse_message(bytes);
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().code, make_error_code(SccpErrc::unknown_type));
        EXPECT_TRUE(res.error().code == SccpCondition::unsupported_type);
        EXPECT_EQ(res.error().type, raw);
    }
}

// A lone tag byte is still dispatched by its type
TEST_F(ParseMessageTest, SingleByteBuffers) {
    std::vector<uint8_t> reserved = {0x11};
    auto r1 = parse_message(reserved);
    ASSERT_FALSE(r1.has_value());
    EXPECT_TRUE(r1.error().code == SccpCondition::unsupported_type);

    std::vector<uint8_t> dt1 = {0x06};
    auto r2 = parse_message(dt1);
    ASSERT_FALSE(r2.has_value());
    EXPECT_TRUE(r2.error().code == SccpCondition::truncated_buffer);
    EXPECT_EQ(r2.error().type, 0x06);
}

TEST_F(ParseMessageTest, EmptyBuffer) {
    auto res = parse_message({});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, make_error_code(SccpErrc::unexpected_eof));
    EXPECT_EQ(res.error().type, 0);
}

TEST_F(ParseMessageTest, TruncatedDT1) {
    std::vector<uint8_t> bytes(dt1_.begin(), dt1_.end() - 1);
    auto res = parse_message(bytes);
    ASSERT_FALSE(res.has_value());
    EXPECT_TRUE(res.error().code == SccpCondition::truncated_buffer);
    EXPECT_EQ(res.error().type, 0x06);
}

// Strict mode rejects padding that the default mode accepts
TEST_F(ParseMessageTest, StrictPointers) {
    std::vector<uint8_t> padded = {0x06, 0x01, 0x02, 0x03, 0x00, 0x02, 0xFF, 0x02, 0xAA, 0xBB};

    auto lenient = parse_message(padded);
    ASSERT_TRUE(lenient.has_value());
    EXPECT_FALSE(lenient.value()->has_canonical_pointers());

    ParseOptions strict{};
    strict.strict_pointers = true;
    auto rejected = parse_message(padded, strict);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, make_error_code(SccpErrc::invalid_pointer));

    auto accepted = parse_message(dt1_, strict);
    EXPECT_TRUE(accepted.has_value());
}

// Pointer 0 is accepted by default and rejected in strict mode
TEST_F(ParseMessageTest, ZeroPointerDT1) {
    std::vector<uint8_t> bytes = {0x06, 0x01, 0x02, 0x03, 0x00, 0x00, 0x00, 0x00};

    auto lenient = parse_message(bytes);
    ASSERT_TRUE(lenient.has_value()) << lenient.error().message();
    auto* d = dynamic_cast<const DT1*>(lenient.value().get());
    ASSERT_NE(d, nullptr);
    EXPECT_TRUE(d->data.empty());

    ParseOptions strict{};
    strict.strict_pointers = true;
    auto rejected = parse_message(bytes, strict);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, make_error_code(SccpErrc::invalid_pointer));
    EXPECT_EQ(rejected.error().type, 0x06);
}

TEST_F(ParseMessageTest, ErrorMessageNamesType) {
    std::vector<uint8_t> bytes = {0x07};
    auto res = parse_message(bytes);
    ASSERT_FALSE(res.has_value());
    auto text = res.error().message();
    EXPECT_NE(text.find("message type not implemented"), std::string::npos);
    EXPECT_NE(text.find("0x07"), std::string::npos);
}

// Failures are logged at debug level on the codec logger
TEST_F(ParseMessageTest, FailureIsLogged) {
    auto& mgr = utils::LogManager::instance();
    mgr.set_global_level(utils::LogLevel::Debug);
    mgr.add_global_sink(std::make_shared<utils::ConsoleLogSink>(captured_, false));

    std::vector<uint8_t> bytes = {0x15};
    auto res = parse_message(bytes);
    ASSERT_FALSE(res.has_value());

    auto text = captured_.str();
    EXPECT_NE(text.find("sccp.codec"), std::string::npos);
    EXPECT_NE(text.find("DEBUG"), std::string::npos);
    EXPECT_NE(text.find("unknown message type"), std::string::npos);
}
