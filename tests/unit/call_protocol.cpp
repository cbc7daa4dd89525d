#include "runtime/call_protocol.hpp"
#include "runtime/errors.hpp"

#include <gtest/gtest.h>

using namespace wasmbox::runtime;
using json = nlohmann::json;

TEST(CallProtocol, FreshNoncePerCall)
{
    auto first = CallProtocol::generate();
    auto second = CallProtocol::generate();

    EXPECT_EQ(first.nonce().size(), 32u);
    EXPECT_EQ(first.nonce().find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(first.nonce(), second.nonce());

    EXPECT_NE(first.ok_marker().find(first.nonce()), std::string::npos);
    EXPECT_NE(first.ok_marker(), first.error_marker());
    EXPECT_NE(first.error_marker(), first.end_marker());
    EXPECT_NE(first.unserializable_marker(), first.ok_marker());
    EXPECT_NE(first.unserializable_marker(), first.error_marker());
}

TEST(CallProtocol, QuoteLiteral)
{
    EXPECT_EQ(quote_literal("plain"), R"("plain")");
    EXPECT_EQ(quote_literal("a\"b\\c\nd"), R"("a\"b\\c\nd")");
    EXPECT_EQ(quote_literal("\x01"), R"("\u0001")");
    EXPECT_THROW(quote_literal("\xff\xfe"), InvalidCallSpec);
}

TEST(CallProtocol, JsonLiteralIsAsciiAndDecodesBack)
{
    json value = {
        {"quote", "\"); __import__('os').system('id') #"},
        {"triple", "''' \"\"\" \\"},
        {"unicode", "h\xc3\xa9llo \xf0\x9f\x98\x80 \xe4\xb8\x96\xe7\x95\x8c"},
        {"numbers", {1, -2, 3.5, 9007199254740993ULL}},
        {"nested", {{"empty_list", json::array()}, {"empty_map", json::object()}, {"null", nullptr}}}
    };

    std::string literal = encode_json_literal(value);
    for (unsigned char c : literal) {
        EXPECT_LT(c, 0x80);
        EXPECT_NE(c, '\n');
    }

    // The literal is a JSON string whose content is the JSON document
    auto text = json::parse(literal).get<std::string>();
    EXPECT_EQ(json::parse(text), value);
}

TEST(CallProtocol, RenderedProgram)
{
    CallProtocol protocol("0123456789abcdef0123456789abcdef");
    CallSpec spec;
    spec.function_name = "add";
    spec.args = json::array({1, "two\"); exit() #"});
    spec.kwargs = {{"scale", 3}};

    std::string code = "def add(a, b, scale=1):\n    return a + b";
    std::string program = render_call_program(code, spec, protocol);

    // User code first, untouched, terminated by a newline
    EXPECT_EQ(program.rfind(code + "\n", 0), 0u);

    EXPECT_NE(program.find(encode_json_literal(spec.args)), std::string::npos);
    EXPECT_NE(program.find(encode_json_literal(spec.kwargs)), std::string::npos);
    EXPECT_NE(program.find(quote_literal("add")), std::string::npos);
    EXPECT_NE(program.find(quote_literal(protocol.ok_marker())), std::string::npos);
    EXPECT_NE(program.find(quote_literal(protocol.end_marker())), std::string::npos);
    EXPECT_NE(program.find(quote_literal(protocol.unserializable_marker())), std::string::npos);

    // Argument text never appears unescaped
    EXPECT_EQ(program.find("two\"); exit()"), std::string::npos);
    EXPECT_NE(program.find("_json.loads("), std::string::npos);
}

TEST(CallProtocol, RejectsBadArguments)
{
    auto protocol = CallProtocol::generate();

    CallSpec not_a_list;
    not_a_list.args = {{"a", 1}};
    EXPECT_THROW(render_call_program("", not_a_list, protocol), InvalidCallSpec);

    CallSpec not_a_map;
    not_a_map.kwargs = json::array({1});
    EXPECT_THROW(render_call_program("", not_a_map, protocol), InvalidCallSpec);

    CallSpec bad_utf8;
    bad_utf8.args = json::array({"\xc3\x28"});
    EXPECT_THROW(render_call_program("", bad_utf8, protocol), InvalidCallSpec);
}

class FrameExtraction : public ::testing::Test {
protected:
    CallProtocol protocol{"feedfacefeedfacefeedfacefeedface"};

    std::string frame(const std::string& marker, const std::string& payload) const {
        return "\n" + marker + payload + "\n" + protocol.end_marker() + "\n";
    }
};

TEST_F(FrameExtraction, Result)
{
    auto frame_opt = extract_frame("hello\n" + frame(protocol.ok_marker(), "[1, 2]"), protocol);
    ASSERT_TRUE(frame_opt.has_value());
    EXPECT_EQ(frame_opt->kind, FrameKind::RESULT);
    EXPECT_EQ(frame_opt->payload, "[1, 2]");
    EXPECT_EQ(frame_opt->user_output, "hello\n");
}

TEST_F(FrameExtraction, Error)
{
    auto frame_opt = extract_frame(frame(protocol.error_marker(), R"({"type": "ValueError", "message": "boom"})"),
                                   protocol);
    ASSERT_TRUE(frame_opt.has_value());
    EXPECT_EQ(frame_opt->kind, FrameKind::ERROR);
    EXPECT_EQ(json::parse(frame_opt->payload)["type"], "ValueError");
    EXPECT_EQ(frame_opt->user_output, "");
}

TEST_F(FrameExtraction, Unserializable)
{
    auto frame_opt = extract_frame(
        "out\n" + frame(protocol.unserializable_marker(), R"({"type": "TypeError", "message": "m"})"),
        protocol);
    ASSERT_TRUE(frame_opt.has_value());
    EXPECT_EQ(frame_opt->kind, FrameKind::UNSERIALIZABLE);
    EXPECT_EQ(frame_opt->user_output, "out\n");
}

TEST_F(FrameExtraction, NoFrame)
{
    EXPECT_FALSE(extract_frame("", protocol).has_value());
    EXPECT_FALSE(extract_frame("just output\n", protocol).has_value());
    // Marker without terminating end marker
    EXPECT_FALSE(extract_frame("\n" + protocol.ok_marker() + "1\n", protocol).has_value());
    // End marker without any result marker
    EXPECT_FALSE(extract_frame("\n1\n" + protocol.end_marker() + "\n", protocol).has_value());
}

TEST_F(FrameExtraction, MustTerminateStream)
{
    std::string text = frame(protocol.ok_marker(), "1") + "printed after the frame\n";
    EXPECT_FALSE(extract_frame(text, protocol).has_value());
}

TEST_F(FrameExtraction, ForeignNonceIgnored)
{
    CallProtocol other{"00000000000000000000000000000000"};
    std::string forged = "\n" + other.ok_marker() + "999\n" + other.end_marker() + "\n";

    EXPECT_FALSE(extract_frame(forged, protocol).has_value());

    auto frame_opt = extract_frame(forged + frame(protocol.ok_marker(), "7"), protocol);
    ASSERT_TRUE(frame_opt.has_value());
    EXPECT_EQ(frame_opt->payload, "7");
    EXPECT_EQ(frame_opt->user_output, forged);
}

TEST_F(FrameExtraction, LastFrameWins)
{
    std::string text = frame(protocol.ok_marker(), "1") + frame(protocol.error_marker(),
        R"({"type": "KeyError", "message": "k"})");
    auto frame_opt = extract_frame(text, protocol);
    ASSERT_TRUE(frame_opt.has_value());
    EXPECT_EQ(frame_opt->kind, FrameKind::ERROR);
}
