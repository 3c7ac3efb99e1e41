#include <drogon/drogon_test.h>
#include <marksite/InlineRenderer.hpp>

using namespace marksite;

DROGON_TEST(InlineRenderer)
{
    CHECK(renderInline("asd") == "asd");
    CHECK(renderInline("a &lt; b &amp; c") == "a &lt; b &amp; c");
    CHECK(renderInline("*asd*") == "<em>asd</em>");
    CHECK(renderInline("_asd_") == "<em>asd</em>");
    CHECK(renderInline("**asd**") == "<strong>asd</strong>");
    CHECK(renderInline("__asd__") == "<u>asd</u>");
    CHECK(renderInline("asd `asd`") == "asd <code>asd</code>");
    CHECK(renderInline("This is *great* and **bold**.") == "This is <em>great</em> and <strong>bold</strong>.");
    CHECK(renderInline("__init__ and _x_") == "<u>init</u> and <em>x</em>");
    CHECK(renderInline("a `b` *c* `d`") == "a <code>b</code> <em>c</em> <code>d</code>");
}

DROGON_TEST(InlineRendererCodeSpanIsLiteral)
{
    CHECK(renderInline("asd `*asd*`") == "asd <code>*asd*</code>");
    CHECK(renderInline("`**x** __y__`") == "<code>**x** __y__</code>");
    // Markers never pair across a code span
    CHECK(renderInline("*a `b` c*") == "*a <code>b</code> c*");
}

DROGON_TEST(InlineRendererUnterminated)
{
    CHECK(renderInline("1*1=1") == "1*1=1");
    CHECK(renderInline("**") == "**");
    CHECK(renderInline("__") == "__");
    CHECK(renderInline("**open") == "**open");
    CHECK(renderInline("*asd_") == "*asd_");
    CHECK(renderInline("`code") == "`code");
    CHECK(renderInline("``") == "``");
}

DROGON_TEST(InlineRendererLongLines)
{
    std::string prose = "see my_var ";
    while(prose.size() < 100000)
        prose += "lorem ipsum dolor ";
    CHECK(renderInline(prose) == prose);

    const std::string word(100000, 'a');
    CHECK(renderInline("**" + word + "**") == "<strong>" + word + "</strong>");
    CHECK(renderInline("`" + word + "` *y*") == "<code>" + word + "</code> <em>y</em>");
    CHECK(renderInline(word + " *y") == word + " *y");
}

DROGON_TEST(InlineRendererTexIsNotSpecial)
{
    // Underscores in inline TeX pair like any other marker. Use a $$ block to keep them
    CHECK(renderInline("a_1 + b_2 = c^{**}") == "a<em>1 + b</em>2 = c^{**}");
    CHECK(renderInline("***a**") == "*<strong>a</strong>");
}
