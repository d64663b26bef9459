#include <gtest/gtest.h>

#include "../src/auth/captcha.hpp"

static const char *CAPTCHA_AREA =
    "<span style='position:absolute;padding-left:31px;padding-top:4px;'>&#52;</span>"
    "<span style='position:absolute;padding-left:8px;padding-top:6px;'>&#49;</span>"
    "<span style='position:absolute;padding-left:50px;padding-top:3px;'>&#57;</span>"
    "<span style='position:absolute;padding-left:19px;padding-top:5px;'>&#56;</span>";

TEST(captcha_test, glyphs_in_offset_order) {
    EXPECT_EQ(solve_positional_captcha(CAPTCHA_AREA, ""), "1849");
}

TEST(captcha_test, transforms) {
    EXPECT_EQ(solve_positional_captcha(CAPTCHA_AREA, "reverse"), "9481");
    EXPECT_EQ(solve_positional_captcha(CAPTCHA_AREA, "move_3rd_to_front"), "4189");
    EXPECT_EQ(solve_positional_captcha("<span style=\"padding-left:3px\">a</span><span style=\"padding-left:9px\">b</span>", "move_3rd_to_front"), "ab");
}

TEST(captcha_test, no_glyphs) {
    EXPECT_FALSE(solve_positional_captcha("<img src=\"/captchas/123.jpg\">", "").has_value());
    EXPECT_FALSE(solve_positional_captcha("<span style=\"padding-left:3px\"> </span>", "").has_value());
}

TEST(captcha_test, oversized_offset_is_skipped) {
    EXPECT_FALSE(solve_positional_captcha("<span style=\"padding-left:99999999999999999999999px\">7</span>", "").has_value());
    const auto area = std::string(CAPTCHA_AREA) + "<span style='padding-left:99999999999999999999999px'>5</span>";
    EXPECT_EQ(solve_positional_captcha(area, ""), "1849");
}

TEST(captcha_test, hidden_fields) {
    const auto fields = extract_hidden_fields(
        "<form>"
        "<input type=\"hidden\" name=\"op\" value=\"login\">"
        "<INPUT TYPE=HIDDEN NAME=redirect VALUE=/?op=my_files>"
        "<input name='rand' type='hidden' value='a&amp;b'>"
        "<input type=\"hidden\" name=\"empty\">"
        "<input type=\"text\" name=\"login\" value=\"ignored\">"
        "<input type=\"hidden\" value=\"no name\">"
        "</form>");
    ASSERT_EQ(fields.size(), 4);
    EXPECT_EQ(fields.at("op"), "login");
    EXPECT_EQ(fields.at("redirect"), "/?op=my_files");
    EXPECT_EQ(fields.at("rand"), "a&b");
    EXPECT_EQ(fields.at("empty"), "");
}

TEST(captcha_test, entities) {
    EXPECT_EQ(decode_html_entities("&#65;&#x42;&lt;&gt;&quot;&amp;"), "AB<>\"&");
    EXPECT_EQ(decode_html_entities("a & b"), "a & b");
    EXPECT_EQ(decode_html_entities("&unknown;"), "&unknown;");
    EXPECT_EQ(decode_html_entities("&#xZZ;"), "&#xZZ;");
}
