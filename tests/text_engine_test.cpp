#include "core/diagnostics.hpp"
#include "core/system_world.hpp"
#include "core/text_engine.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>

using Kind = Directive::Kind;

TEST(ParseDirectivesTest, RecognisesEveryDirective) {
  auto directives = parse_directives("plain\n"
                                     "#include \"ch1.txt\"\n"
                                     "#pagebreak\n"
                                     "#font \"DejaVu Sans\"\n"
                                     "#size 12.5\n"
                                     "\\#literal\n");

  ASSERT_EQ(directives.size(), 6u);
  EXPECT_EQ(directives[0].kind, Kind::Text);
  EXPECT_EQ(directives[0].argument, "plain");
  EXPECT_EQ(directives[1].kind, Kind::Include);
  EXPECT_EQ(directives[1].argument, "ch1.txt");
  EXPECT_EQ(directives[2].kind, Kind::PageBreak);
  EXPECT_EQ(directives[3].kind, Kind::Font);
  EXPECT_EQ(directives[3].argument, "DejaVu Sans");
  EXPECT_EQ(directives[4].kind, Kind::Size);
  EXPECT_DOUBLE_EQ(directives[4].number, 12.5);
  EXPECT_EQ(directives[5].kind, Kind::Text);
  EXPECT_EQ(directives[5].argument, "#literal");
}

TEST(ParseDirectivesTest, RecordsLineSpans) {
  auto directives = parse_directives("ab\r\n#oops\n");

  ASSERT_EQ(directives.size(), 2u);
  EXPECT_EQ(directives[0].start, 0u);
  EXPECT_EQ(directives[0].end, 2u);
  EXPECT_EQ(directives[1].kind, Kind::Error);
  EXPECT_EQ(directives[1].argument, "unknown directive `#oops`");
  EXPECT_EQ(directives[1].start, 4u);
  EXPECT_EQ(directives[1].end, 9u);
}

TEST(ParseDirectivesTest, RejectsMalformedArguments) {
  EXPECT_EQ(parse_directives("#include ch1.txt")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size big")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size 0")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size -3")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size inf")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size nan")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size 1e300")[0].kind, Kind::Error);
  EXPECT_EQ(parse_directives("#size 1000")[0].kind, Kind::Size);
  EXPECT_EQ(parse_directives("#pagebreak now")[0].kind, Kind::Error);
}

class TextEngineTest : public ::testing::Test {
protected:
  std::expected<Document, std::vector<SourceError>>
  compile(const std::string &main) {
    world.reset();
    auto id = world.resolve(dir.path() / main);
    EXPECT_TRUE(id.has_value());
    world.set_main(*id);
    return engine.compile(world);
  }

  TempDir dir;
  SystemWorld world{dir.path(), {}, false};
  TextEngine engine;
};

TEST_F(TextEngineTest, BlankDocumentNeedsNoFonts) {
  dir.write("main.txt", "\n\n#pagebreak\n");

  auto document = compile("main.txt");
  ASSERT_TRUE(document.has_value());
  ASSERT_EQ(document->pages.size(), 2u);
  EXPECT_DOUBLE_EQ(document->pages[0].width, TextEngine::page_width);

  Pixmap page = engine.render(world, document->pages[0], 0.25f);
  EXPECT_EQ(page.width(), 149u);
  EXPECT_EQ(page.height(), 211u);
  EXPECT_EQ(page.data()[0], 255);
  EXPECT_EQ(page.data()[3], 255);
}

TEST_F(TextEngineTest, TextWithoutFontsIsAnError) {
  dir.write("main.txt", "hello\n");

  auto document = compile("main.txt");
  ASSERT_FALSE(document.has_value());
  ASSERT_EQ(document.error().size(), 1u);
  EXPECT_EQ(document.error()[0].message,
            "no fonts available (pass --font-path)");
}

TEST_F(TextEngineTest, MissingIncludeNamesThePath) {
  dir.write("main.txt", "#include \"missing.txt\"\n");

  auto document = compile("main.txt");
  ASSERT_FALSE(document.has_value());
  ASSERT_EQ(document.error().size(), 1u);

  const SourceError &error = document.error()[0];
  EXPECT_NE(error.message.find("missing.txt"), std::string::npos);
  ASSERT_TRUE(error.span.has_value());
  EXPECT_EQ(error.span->start, 0u);
}

TEST_F(TextEngineTest, ErrorsInsideIncludesCarryTrace) {
  dir.write("main.txt", "\n#include \"sub/ch1.txt\"\n");
  dir.write("sub/ch1.txt", "#include \"/main.txt\"\n");

  auto document = compile("main.txt");
  ASSERT_FALSE(document.has_value());
  ASSERT_EQ(document.error().size(), 1u);

  const SourceError &error = document.error()[0];
  EXPECT_NE(error.message.find("cyclic include"), std::string::npos);
  ASSERT_EQ(error.trace.size(), 1u);
  EXPECT_EQ(error.trace[0].message, "error occurred in this include");
  EXPECT_EQ(error.trace[0].span.start, 1u);

  std::ostringstream out;
  print_diagnostics(out, world, document.error());
  EXPECT_NE(out.str().find("ch1.txt:1:1"), std::string::npos);
  EXPECT_NE(out.str().find("main.txt:2:1"), std::string::npos);
  EXPECT_NE(out.str().find("help: error occurred in this include"),
            std::string::npos);
}

TEST_F(TextEngineTest, OversizedFontSizeIsAnErrorNotALayout) {
  dir.write("main.txt", "#size inf\n#size 1e300\n");

  auto document = compile("main.txt");
  ASSERT_FALSE(document.has_value());
  ASSERT_EQ(document.error().size(), 2u);
  EXPECT_EQ(document.error()[0].message,
            "expected a positive font size after `#size`");
  EXPECT_EQ(document.error()[1].span->start, 10u);
}

TEST_F(TextEngineTest, UnknownFontFamilyIsReported) {
  dir.write("main.txt", "#font \"Nonexistent Sans\"\n");

  auto document = compile("main.txt");
  ASSERT_FALSE(document.has_value());
  EXPECT_EQ(document.error()[0].message,
            "unknown font family `Nonexistent Sans`");
}

TEST_F(TextEngineTest, EvictDropsStaleParses) {
  dir.write("a.txt", "\n");
  dir.write("b.txt", "\n\n");

  ASSERT_TRUE(compile("a.txt").has_value());
  ASSERT_TRUE(compile("b.txt").has_value());
  EXPECT_EQ(engine.memo_size(), 2u);

  engine.evict(1);
  EXPECT_EQ(engine.memo_size(), 2u);
  engine.evict(1);
  EXPECT_EQ(engine.memo_size(), 0u);

  ASSERT_TRUE(compile("a.txt").has_value());
  engine.evict(0);
  EXPECT_EQ(engine.memo_size(), 0u);
}
