// tests/unit/basic/test_diagnostic.cpp - Unit tests for DiagnosticBag and DiagnosticBuilder
//

#include <gtest/gtest.h>

#include <utility>

#include "tlc/basic/diagnostic.hpp"

using namespace tlc;

TEST(DiagnosticBagTest, StartsEmpty)
{
  DiagnosticBag bag;
  EXPECT_TRUE(bag.empty());
  EXPECT_EQ(bag.size(), 0U);
  EXPECT_FALSE(bag.has_errors());
  EXPECT_FALSE(bag.has_warnings());
}

TEST(DiagnosticBagTest, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error("Unbound variable: y", "y");
    builder.with_code("E001");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].code, "E001");
}

TEST(DiagnosticBagTest, FluentChain)
{
  DiagnosticBag bag;
  bag.report_error("Linear variable x must be used exactly once.", "(\\x: Linear[Int]. y)")
    .with_code("E002")
    .with_note("a linear parameter must appear in the body of its abstraction")
    .with_help("use 'x' in the body");

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.notes.size(), 1U);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "use 'x' in the body");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->subject, "(\\x: Linear[Int]. y)");
}

TEST(DiagnosticBagTest, EmptySubjectAddsNoLabel)
{
  DiagnosticBag bag;
  bag.report_error("unknown sample 'nope'");
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_TRUE(bag.all()[0].labels.empty());
  EXPECT_EQ(bag.all()[0].primary_label(), nullptr);
}

TEST(DiagnosticBagTest, MovedBuilderReportsOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_warning("shadowed binding", "x");
    auto second = std::move(first);
    second.with_code("W001");
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].code, "W001");
}

TEST(DiagnosticBagTest, FiltersBySeverity)
{
  DiagnosticBag bag;
  bag.report_error("e1");
  bag.report_warning("w1");
  bag.report_info("i1");
  bag.report_error("e2");

  EXPECT_EQ(bag.size(), 4U);
  EXPECT_EQ(bag.errors().size(), 2U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
}

TEST(DiagnosticBagTest, MergeKeepsOrder)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error("first");
  b.report_error("second");
  b.report_error("third");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 3U);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[2].message, "third");
}

TEST(DiagnosticBagTest, SecondaryLabelIsNotPrimary)
{
  DiagnosticBag bag;
  bag.report_error("Unbound variable: y", "y").with_secondary_label("(\\x: Int. y)", "in");

  const Diagnostic & d = bag.all()[0];
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.primary_label()->subject, "y");
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
}
