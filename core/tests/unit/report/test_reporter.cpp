// test_reporter.cpp - Diagnostic ordering and run outcome
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "schemaflow/report/reporter.hpp"

using namespace schemaflow;

namespace
{

std::vector<std::string> messages_of(const std::vector<Diagnostic> & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.message);
  }
  return out;
}

}  // namespace

// =============================================================================
// Ordering
// =============================================================================

TEST(DiagnosticReporter, OrdersByPathThenOffset)
{
  SourceRegistry sources;
  const FileId b = sources.register_file("pkg/b.py", "x = 1\ny = 2\n");
  const FileId a = sources.register_file("pkg/a.py", "x = 1\ny = 2\n");

  DiagnosticBag first;
  first.report_error(SourceRange(b, 6, 7), "b second");
  first.report_error(SourceRange(b, 0, 1), "b first");

  DiagnosticBag second;
  second.report_warning(SourceRange(a, 6, 7), "a second");
  second.report_error(SourceRange(a, 0, 1), "a first");

  DiagnosticReporter reporter(sources);
  reporter.add(first);
  reporter.add(second);

  EXPECT_EQ(reporter.size(), 4U);
  EXPECT_EQ(
    messages_of(reporter.ordered()),
    (std::vector<std::string>{"a first", "a second", "b first", "b second"}));
}

TEST(DiagnosticReporter, SameLocationKeepsInsertionOrder)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "df['x']\n");

  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 3, 6), "one");
  bag.report_warning(SourceRange(f, 3, 6), "two");
  bag.report_error(SourceRange(f, 3, 6), "three");

  DiagnosticReporter reporter(sources);
  reporter.add(bag);
  EXPECT_EQ(messages_of(reporter.ordered()), (std::vector<std::string>{"one", "two", "three"}));
}

TEST(DiagnosticReporter, UnlocatedDiagnosticsComeFirst)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "x = 1\n");

  DiagnosticBag bag;
  bag.report_error(SourceRange(f, 0, 1), "located");
  bag.report_warning(SourceRange(), "nowhere").with_code(codes::k_no_source_files);

  DiagnosticReporter reporter(sources);
  reporter.add(bag);
  EXPECT_EQ(messages_of(reporter.ordered()), (std::vector<std::string>{"nowhere", "located"}));
}

// =============================================================================
// Outcome
// =============================================================================

TEST(DiagnosticReporter, OutcomeDependsOnSeverityAndStrictness)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "x = 1\n");

  DiagnosticReporter empty(sources);
  EXPECT_EQ(empty.outcome(false), RunOutcome::Clean);
  EXPECT_EQ(empty.outcome(true), RunOutcome::Clean);

  DiagnosticBag warnings;
  warnings.report_warning(SourceRange(f, 0, 1), "careful");
  DiagnosticReporter warned(sources);
  warned.add(warnings);
  EXPECT_EQ(warned.outcome(false), RunOutcome::Clean);
  EXPECT_EQ(warned.outcome(true), RunOutcome::Findings);

  DiagnosticBag errors;
  errors.report_error(SourceRange(f, 0, 1), "broken");
  DiagnosticReporter failed(sources);
  failed.add(errors);
  EXPECT_EQ(failed.outcome(false), RunOutcome::Findings);
}

TEST(DiagnosticReporter, InfoNeverFails)
{
  SourceRegistry sources;
  const FileId f = sources.register_file("m.py", "x = 1\n");
  DiagnosticBag bag;
  bag.report_info(SourceRange(f, 0, 1), "fyi");
  EXPECT_EQ(compute_outcome(bag.all(), true), RunOutcome::Clean);
}

TEST(DiagnosticReporter, CountsBySeverity)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(), "e1");
  bag.report_warning(SourceRange(), "w1");
  bag.report_error(SourceRange(), "e2");
  EXPECT_EQ(count_severity(bag.all(), Severity::Error), 2U);
  EXPECT_EQ(count_severity(bag.all(), Severity::Warning), 1U);
  EXPECT_EQ(count_severity(bag.all(), Severity::Info), 0U);
}

TEST(RunOutcome, ExitCodes)
{
  EXPECT_EQ(exit_code(RunOutcome::Clean), 0);
  EXPECT_EQ(exit_code(RunOutcome::Findings), 1);
  EXPECT_EQ(exit_code(RunOutcome::InternalFailure), 2);
  EXPECT_EQ(to_string(RunOutcome::Findings), "findings");
  EXPECT_EQ(to_string(RunOutcome::InternalFailure), "internal_failure");
}
