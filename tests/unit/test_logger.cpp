#include <string>

#include <gtest/gtest.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "pathgate/core/logger.h"

namespace {

std::string RoundTrip(const std::string& value) {
    const std::string line = "{\"path\":\"" + pathgate::core::EscapeJson(value) + "\"}";
    Poco::JSON::Parser parser;
    auto object = parser.parse(line).extract<Poco::JSON::Object::Ptr>();
    return object->getValue<std::string>("path");
}

}  // namespace

TEST(EscapeJson, QuotesAndBackslashes) {
    EXPECT_EQ(pathgate::core::EscapeJson(R"(C:\a "b")"), R"(C:\\a \"b\")");
    EXPECT_EQ(RoundTrip(R"(C:\a "b")"), R"(C:\a "b")");
}

TEST(EscapeJson, ControlCharactersBecomeUnicodeEscapes) {
    EXPECT_EQ(pathgate::core::EscapeJson(std::string("a\x01" "b")), "a\\u0001b");
    EXPECT_EQ(RoundTrip(std::string("\x1f")), std::string("\x1f"));
    EXPECT_EQ(pathgate::core::EscapeJson("tab\tnl\n"), "tab\\tnl\\n");

    const std::string hostile = std::string("/data/\x01\x08\x0c\x1b") + "x";
    EXPECT_EQ(RoundTrip(hostile), hostile);
}
