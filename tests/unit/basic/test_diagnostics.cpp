// tests/basic/test_diagnostics.cpp - Diagnostic bag, message reporter and printer
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "dml/basic/diagnostic.hpp"
#include "dml/basic/diagnostic_printer.hpp"
#include "dml/basic/message_registry.hpp"
#include "dml/basic/message_reporter.hpp"
#include "dml/basic/source_location.hpp"

using namespace dml;

// ============================================================================
// Message Formatting
// ============================================================================

TEST(MessageRegistry, SubstitutesPlaceholdersCaseInsensitively)
{
  const std::string text =
    format_message("Artifact $(ART) has no element $(MEMBER)", {{"art", "ns.E"}, {"member", "x"}});
  EXPECT_EQ(text, "Artifact “ns.E” has no element “x”");
}

TEST(MessageRegistry, QuotesEveryEntryOfNameLists)
{
  const std::string text = format_message("Replace by $(NAMES)", {{"names", "A.x, B.x"}});
  EXPECT_EQ(text, "Replace by “A.x”, “B.x”");
}

TEST(MessageRegistry, KeepsUnknownPlaceholders)
{
  EXPECT_EQ(format_message("Value $(FOO)", {}), "Value $(FOO)");
}

TEST(MessageRegistry, TextVariants)
{
  const MessageSpec * spec = MessageRegistry::instance().find("ref-cyclic");
  ASSERT_NE(spec, nullptr);
  EXPECT_NE(spec->text("element").find("$(MEMBER)"), std::string_view::npos);
  // Unknown variants fall back to the first text.
  EXPECT_EQ(spec->text("nope"), spec->text("std"));
}

// ============================================================================
// MessageReporter
// ============================================================================

TEST(MessageReporter, UsesRegisteredSeverity)
{
  DiagnosticBag bag;
  MessageReporter reporter(bag);
  reporter.report("redirected-to-same", {}, "V:toB", {{"art", "B"}});
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].severity, Severity::Info);
  EXPECT_EQ(bag.all()[0].home, "V:toB");
  EXPECT_FALSE(reporter.has_errors());
}

TEST(MessageReporter, DropsRepeatedReports)
{
  DiagnosticBag bag;
  MessageReporter reporter(bag);
  SourceLocation loc{FileId{0}, 3, 7};
  reporter.report("ref-undefined-art", loc, "E", {{"name", "Foo"}});
  reporter.report("ref-undefined-art", loc, "E", {{"name", "Foo"}});
  reporter.report("ref-undefined-art", SourceLocation{FileId{0}, 4, 1}, "E", {{"name", "Foo"}});
  EXPECT_EQ(bag.count("ref-undefined-art"), 2U);
}

TEST(MessageReporter, KeepsRepeatedReportsWithoutPosition)
{
  DiagnosticBag bag;
  MessageReporter reporter(bag);
  SourceLocation file_only{FileId{0}, 0, 0};
  reporter.report("anno-duplicate", file_only, "E", {{"anno", "@Foo"}});
  reporter.report("anno-duplicate", file_only, "E", {{"anno", "@Foo"}});
  EXPECT_EQ(bag.count("anno-duplicate"), 2U);
}

TEST(MessageReporter, OverridesOnlyConfigurableSeverities)
{
  DiagnosticBag bag;
  MessageReporter reporter(
    bag, {{"anno-duplicate", Severity::Warning}, {"ref-undefined-art", Severity::Warning}});
  reporter.report("anno-duplicate", {}, "E", {{"anno", "@A"}});
  reporter.report("ref-undefined-art", {}, "E", {{"name", "X"}});

  ASSERT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.with_code("anno-duplicate")[0].severity, Severity::Warning);
  EXPECT_EQ(bag.with_code("ref-undefined-art")[0].severity, Severity::Error);
}

TEST(MessageReporter, UnknownIdIsInternalError)
{
  DiagnosticBag bag;
  MessageReporter reporter(bag);
  EXPECT_THROW(reporter.report("no-such-message", {}, "E"), InternalError);
}

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(DiagnosticBag, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_warning({}, "something odd");
    builder.with_code("odd").with_help("look again");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_FALSE(bag.has_errors());
  EXPECT_EQ(bag.all()[0].code, "odd");
  ASSERT_TRUE(bag.all()[0].help_message.has_value());
}

TEST(DiagnosticBag, DiscardedBuilderAddsNothing)
{
  DiagnosticBag bag;
  bag.report_error({}, "dropped").discard();
  EXPECT_TRUE(bag.empty());
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticPrinter, PrintsHeaderLocationAndHome)
{
  SourceRegistry sources;
  const FileId file = sources.add_file("model.cds");
  DiagnosticBag bag;
  MessageReporter reporter(bag);
  reporter.report("ref-undefined-art", SourceLocation{file, 5, 12}, "ns.Foo", {{"name", "Bar"}});

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[ref-undefined-art]: No artifact has been found with name “Bar”"),
            std::string::npos);
  EXPECT_NE(text.find("model.cds:5:12"), std::string::npos);
  EXPECT_NE(text.find("= note: in ns.Foo"), std::string::npos);
}

TEST(DiagnosticPrinter, ShowsSourceLineWhenContentIsKnown)
{
  SourceRegistry sources;
  const FileId file = sources.add_file("model.cds", "entity Foo {\n  x : Bar;\n}\n");
  DiagnosticBag bag;
  bag.report_error(SourceLocation{file, 2, 7}, "unknown type");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("   2 |   x : Bar;"), std::string::npos);
  EXPECT_NE(text.find("      |       ^"), std::string::npos);
}

TEST(DiagnosticPrinter, OrdersByLocation)
{
  SourceRegistry sources;
  const FileId file = sources.add_file("model.cds");
  DiagnosticBag bag;
  bag.report_error(SourceLocation{file, 9, 1}, "second");
  bag.report_error(SourceLocation{file, 2, 1}, "first");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, sources);

  const std::string text = out.str();
  EXPECT_LT(text.find("first"), text.find("second"));
}
