#include "helpers/HelperLibrary.h"
#include <gtest/gtest.h>

namespace SBX {

class StringHelpersTest : public ::testing::Test {
protected:
    HostValue call(const std::string &name, const HelperArgs &args) {
        return library_->call(HelperNamespace::String, name, args);
    }

    std::shared_ptr<const HelperLibrary> library_ = HelperLibrary::createDefault();
};

TEST_F(StringHelpersTest, Case_ConvertsAsciiOnly) {
    EXPECT_EQ(call("upper", {"hello World"}), "HELLO WORLD");
    EXPECT_EQ(call("lower", {"MiXeD"}), "mixed");
    EXPECT_EQ(call("upper", {"straße"}), "STRAßE");
    EXPECT_EQ(call("capitalize", {"hELLO"}), "Hello");
    EXPECT_EQ(call("capitalize", {""}), "");
}

TEST_F(StringHelpersTest, Upper_MissingArgumentIsEmptyString) {
    EXPECT_EQ(call("upper", {}), "");
    EXPECT_EQ(call("upper", {nullptr}), "");
}

TEST_F(StringHelpersTest, Trim_RemovesSurroundingWhitespace) {
    EXPECT_EQ(call("trim", {"  \t padded \n"}), "padded");
    EXPECT_EQ(call("trim", {"   "}), "");
}

TEST_F(StringHelpersTest, Replace_ReplacesEveryOccurrence) {
    EXPECT_EQ(call("replace", {"a-b-c", "-", "+"}), "a+b+c");
    EXPECT_EQ(call("replace", {"none", "x", "y"}), "none");
}

TEST_F(StringHelpersTest, Split_AndJoin) {
    EXPECT_EQ(call("split", {"a,b,,c", ","}), json::array({"a", "b", "", "c"}));
    EXPECT_EQ(call("split", {"abc", ""}), json::array({"a", "b", "c"}));
    EXPECT_EQ(call("split", {"whole"}), json::array({"whole"}));
    EXPECT_EQ(call("join", {json::array({"x", 1, true}), " | "}), "x | 1 | true");
    EXPECT_EQ(call("join", {json::array({"a", nullptr, "b"})}), "a,,b");
}

TEST_F(StringHelpersTest, Slug_CollapsesWhitespaceAndDropsPunctuation) {
    EXPECT_EQ(call("slug", {"Hello   World!"}), "hello-world");
    EXPECT_EQ(call("slug", {"Q3 Report (final)"}), "q3-report-final");
}

TEST_F(StringHelpersTest, Truncate_AppendsEllipsisOnlyWhenShortened) {
    EXPECT_EQ(call("truncate", {"abcdef", 3}), "abc...");
    EXPECT_EQ(call("truncate", {"abc", 3}), "abc");
    EXPECT_EQ(call("truncate", {"héllo", 2}), "hé...");
}

TEST_F(StringHelpersTest, Truncate_HugeLengthKeepsWholeString) {
    EXPECT_EQ(call("truncate", {"abcdef", 1e300}), "abcdef");
    EXPECT_EQ(call("truncate", {"abcdef", -1e300}), "...");
    EXPECT_EQ(call("truncate", {"abcdef", 9.5e18}), "abcdef");
}

TEST_F(StringHelpersTest, WrongArgumentType_ThrowsHelperError) {
    EXPECT_THROW(call("lower", {42}), HelperError);
    EXPECT_THROW(call("join", {"not an array"}), HelperError);
    EXPECT_THROW(call("truncate", {"abc", "two"}), HelperError);
}

TEST_F(StringHelpersTest, UnknownHelper_ThrowsHelperError) {
    EXPECT_THROW(call("reverse", {"abc"}), HelperError);
}

}  // namespace SBX
