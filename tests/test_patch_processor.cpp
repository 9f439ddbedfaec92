#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "xml_document.hpp"
#include "kernel/patch_processor.hpp"

using oxp::ErrorSeverity;
using oxp::MergeStrategy;
using oxp::PatchError;
using oxp::PatchErrc;
using oxp::PatchKind;
using oxp::PatchOperation;
using oxp::PatchProcessor;
using oxp::PatchResult;
using oxp::PatchValue;
using oxp::ProcessingContext;
using oxp::ProcessorOptions;
using oxp::RecoveryStrategy;
using oxp::XmlDocument;

namespace {

const char* kSimple = "<root xmlns:a=\"urn:a\"><a:t>old</a:t></root>";

ProcessorOptions quiet_options(RecoveryStrategy recovery = RecoveryStrategy::RetryWithFallback) {
  ProcessorOptions options;
  options.recovery = recovery;
  options.quiet = true;
  return options;
}

PatchOperation set_op(const std::string& target, const std::string& value) {
  return PatchOperation::create(PatchKind::Set, target, PatchValue::text(value));
}

PatchOperation extend_op(const std::string& target, PatchValue value) {
  return PatchOperation::create(PatchKind::Extend, target, std::move(value));
}

}  // namespace

TEST(PatchProcessorTest, AppliesSetEndToEnd) {
  PatchProcessor processor(quiet_options());
  std::vector<PatchResult> results;
  const std::string out = processor.process_xml(kSimple, {set_op("//a:t", "new")}, {}, &results);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_EQ(results[0].affected_elements, 1);
  EXPECT_NE(out.find("<a:t>new</a:t>"), std::string::npos);
  EXPECT_EQ(out.find("old"), std::string::npos);
}

TEST(PatchProcessorTest, ZeroMatchesIsAWarningNotAnError) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse(kSimple);
  PatchResult r = processor.apply(doc, set_op("//a:missing", "x"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.severity, ErrorSeverity::Warning);
  EXPECT_EQ(r.affected_elements, 0);
  EXPECT_NE(r.message.find("//a:missing"), std::string::npos);
}

TEST(PatchProcessorTest, SetIsIdempotent) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse(kSimple);
  std::vector<PatchOperation> ops{set_op("//a:t", "v"), set_op("//a:t/@id", "1")};
  processor.process(doc, ops);
  const std::string once = doc.to_string();
  processor.process(doc, ops);
  EXPECT_EQ(doc.to_string(), once);
}

TEST(PatchProcessorTest, RepeatedIdempotentOperationHitsResultCache) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse(kSimple);
  auto results = processor.process(doc, {set_op("//a:t", "v"), set_op("//a:t", "v")});
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[1].success);
  EXPECT_GE(processor.stats().optimizer.cache_hits, 1u);

  auto events = processor.drain_events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].source, "handler");
  EXPECT_EQ(events[1].source, "cache");
  EXPECT_TRUE(processor.drain_events().empty());
}

TEST(PatchProcessorTest, CollidingNamespaceIsAliasedAndReported) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse(kSimple);
  auto results = processor.process(doc, {set_op("//a:t", "new"), set_op("//a_2:t", "x")}, {{"a", "urn:other"}});

  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].success);
  ASSERT_FALSE(results[0].warnings.empty());
  EXPECT_NE(results[0].warnings[0].find("reachable as 'a_2'"), std::string::npos);

  // The alias resolves; it just matches nothing in this document.
  EXPECT_FALSE(results[1].success);
  EXPECT_EQ(results[1].severity, ErrorSeverity::Warning);
  EXPECT_FALSE(results[1].exception_info && results[1].exception_info->code == PatchErrc::Namespace);

  EXPECT_EQ(processor.resolver().stats().active_sessions, 0u);
}

TEST(PatchProcessorTest, FailFastStopsAtFirstFailure) {
  PatchProcessor processor(quiet_options(RecoveryStrategy::FailFast));
  XmlDocument doc = XmlDocument::parse(kSimple);
  auto results = processor.process(
      doc, {set_op("//a:t", "one"), extend_op("//a:t", PatchValue::text("x")), set_op("//a:t", "three")});
  ASSERT_LE(results.size(), 2u);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].success);
  EXPECT_FALSE(results[1].success);
  EXPECT_NE(doc.to_string().find("<a:t>one</a:t>"), std::string::npos);
}

TEST(PatchProcessorTest, RunContextCountsOnlyExecutedOperations) {
  PatchProcessor processor(quiet_options(RecoveryStrategy::FailFast));
  XmlDocument doc = XmlDocument::parse(kSimple, "part.xml");
  ProcessingContext run;
  auto results = processor.process(
      doc, {set_op("//a:t", "one"), extend_op("//a:t", PatchValue::text("x")), set_op("//a:t", "three")},
      {{"a", "urn:other"}}, &run);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(run.file_identity, "part.xml");
  EXPECT_EQ(run.document_kind, oxp::DocumentKind::Unknown);
  EXPECT_EQ(run.operation_count, 2);
  ASSERT_EQ(run.errors.size(), 1u);
  EXPECT_NE(run.errors[0].find("Operation 1 (extend //a:t) failed"), std::string::npos);
  ASSERT_EQ(run.warnings.size(), 1u);
  EXPECT_NE(run.warnings[0].find("reachable as 'a_2'"), std::string::npos);
  ASSERT_EQ(results[0].affected_files.size(), 1u);
  EXPECT_EQ(results[0].affected_files[0], "part.xml");

  nlohmann::json j = run;
  EXPECT_EQ(j["operation_count"], 2);
  EXPECT_EQ(j["file"], "part.xml");
}

TEST(PatchProcessorTest, BestEffortReportsEveryOperation) {
  PatchProcessor processor(quiet_options(RecoveryStrategy::BestEffort));
  XmlDocument doc = XmlDocument::parse(kSimple);
  auto results = processor.process(
      doc, {set_op("//a:t", "one"), extend_op("//a:t", PatchValue::text("x")), set_op("//a:t", "three")});
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].success);
  EXPECT_FALSE(results[1].success);
  EXPECT_NE(results[1].message.find("requires a list"), std::string::npos);
  EXPECT_EQ(results[1].exception_info->code, PatchErrc::TypeMismatch);
  EXPECT_TRUE(results[2].success);
  EXPECT_NE(doc.to_string().find("<a:t>three</a:t>"), std::string::npos);

  auto stats = processor.stats();
  EXPECT_EQ(stats.operations_processed, 3u);
  EXPECT_EQ(stats.operations_applied, 2u);
  EXPECT_EQ(stats.errors_encountered, 1u);
}

TEST(PatchProcessorTest, RecoversMiscasedPrefix) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse("<root xmlns:w=\"urn:w\"><w:t>x</w:t></root>");
  PatchResult r = processor.apply(doc, set_op("//W:t", "y"));
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.severity, ErrorSeverity::Warning);
  EXPECT_TRUE(r.recovery_attempted);
  EXPECT_TRUE(r.fallback_applied);
  EXPECT_EQ(r.recovery_strategy_used, "retry_with_fallback:target_correction");
  EXPECT_EQ(r.target, "//W:t");
  EXPECT_NE(doc.to_string().find("<w:t>y</w:t>"), std::string::npos);

  auto events = processor.drain_events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].source, "recovery");
  EXPECT_EQ(processor.stats().recovery.successful_recoveries, 1u);
}

TEST(PatchProcessorTest, RecoversUndeclaredPrefixByLocalName) {
  PatchProcessor processor(quiet_options());
  std::vector<PatchResult> results;
  const std::string out = processor.process_xml(kSimple, {set_op("//foo:t", "new")}, {}, &results);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].success);
  EXPECT_TRUE(results[0].fallback_applied);
  EXPECT_EQ(results[0].recovery_strategy_used, "retry_with_fallback:target_correction");
  ASSERT_TRUE(results[0].exception_info.has_value());
  EXPECT_EQ(results[0].exception_info->code, PatchErrc::Namespace);
  EXPECT_NE(out.find("<a:t>new</a:t>"), std::string::npos);
}

TEST(PatchProcessorTest, ResultsStayInSubmissionOrderWhenReordered) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse("<root xmlns:a=\"urn:a\"><a:t y=\"0\"/></root>");
  std::vector<PatchOperation> ops{
      PatchOperation::create(PatchKind::Merge, "//a:t", PatchValue::mapping({{"@x", PatchValue::text("1")}})),
      set_op("//a:t/@y", "2"),
  };
  auto results = processor.process(doc, ops);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].kind, PatchKind::Merge);
  EXPECT_EQ(results[1].kind, PatchKind::Set);

  auto events = processor.drain_events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].index, 1u);
  EXPECT_EQ(processor.stats().optimizer.reordered_plans, 1u);

  const std::string xml = doc.to_string();
  EXPECT_NE(xml.find("x=\"1\""), std::string::npos);
  EXPECT_NE(xml.find("y=\"2\""), std::string::npos);
}

TEST(PatchProcessorTest, InheritingOperationsSeeEarlierOverrides) {
  // Skipping keeps the unresolved prefix visible instead of retrying it by local name.
  PatchProcessor processor(quiet_options(RecoveryStrategy::SkipFailed));
  XmlDocument doc = XmlDocument::parse("<root><item xmlns=\"urn:q\"/></root>");

  PatchOperation::Options declares;
  declares.namespace_overrides["q"] = "urn:q";
  PatchOperation::Options inherits;
  inherits.inherit_namespaces = true;

  auto results = processor.process(
      doc, {
               PatchOperation::create(PatchKind::Set, "//q:item/@a", PatchValue::text("1"), declares),
               PatchOperation::create(PatchKind::Merge, "//q:item", PatchValue::mapping({{"@b", PatchValue::text("2")}}),
                                      inherits),
               PatchOperation::create(PatchKind::Merge, "//q:item", PatchValue::mapping({{"@c", PatchValue::text("3")}})),
           });
  ASSERT_EQ(results.size(), 3u);
  EXPECT_FALSE(results[0].success);  // attribute does not exist yet
  EXPECT_TRUE(results[1].success);
  EXPECT_FALSE(results[2].success);
  ASSERT_TRUE(results[2].exception_info.has_value());
  EXPECT_EQ(results[2].exception_info->code, PatchErrc::Namespace);
}

TEST(PatchProcessorTest, EmptyRunAndUnparseableInput) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse(kSimple);
  EXPECT_TRUE(processor.process(doc, {}).empty());

  try {
    processor.process_xml("<root><unclosed></root>", {set_op("//a:t", "x")});
    FAIL() << "expected PatchError";
  } catch (const PatchError& e) {
    EXPECT_EQ(e.code(), PatchErrc::DocumentParse);
  }
}

TEST(PatchProcessorTest, ValidatesDocumentIntegrity) {
  PatchProcessor processor(quiet_options());
  XmlDocument slide = XmlDocument::parse(
      "<p:sld xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\"><p:cSld/></p:sld>");
  auto broken = processor.validate_integrity(slide);
  EXPECT_FALSE(broken.valid);
  ASSERT_EQ(broken.issues.size(), 1u);
  EXPECT_EQ(broken.issues[0], "p:cSld is missing p:spTree");

  XmlDocument word = XmlDocument::parse(
      "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"/>");
  EXPECT_EQ(processor.validate_integrity(word).issues.at(0), "w:document is missing w:body");

  XmlDocument fine = XmlDocument::parse(kSimple);
  EXPECT_TRUE(processor.validate_integrity(fine).valid);
}

TEST(PatchProcessorTest, StatsSerializeAndReset) {
  PatchProcessor processor(quiet_options());
  XmlDocument doc = XmlDocument::parse(kSimple);
  processor.process(doc, {set_op("//a:t", "v"), set_op("//a:none", "v")});

  nlohmann::json j = processor.stats();
  EXPECT_EQ(j["operations_processed"], 2);
  EXPECT_EQ(j["operations_applied"], 1);
  EXPECT_DOUBLE_EQ(j["success_rate"].get<double>(), 0.5);
  EXPECT_TRUE(j["optimizer"].contains("cache_hits"));
  EXPECT_TRUE(j["namespaces"].contains("collisions"));
  EXPECT_TRUE(j["recovery"].contains("total_errors"));

  nlohmann::json event = processor.drain_events().front();
  EXPECT_EQ(event["kind"], "set");
  EXPECT_EQ(event["source"], "handler");

  processor.reset_stats();
  EXPECT_EQ(processor.stats().operations_processed, 0u);
}

TEST(PatchProcessorTest, SharedOptimizerSpansProcessors) {
  auto optimizer = std::make_shared<oxp::PerformanceOptimizer>();
  PatchProcessor first(quiet_options(), optimizer);
  PatchProcessor second(quiet_options(), optimizer);
  XmlDocument a = XmlDocument::parse(kSimple);
  XmlDocument b = XmlDocument::parse(kSimple);
  first.apply(a, set_op("//a:t", "v"));
  second.apply(b, set_op("//a:t", "v"));
  EXPECT_EQ(optimizer->stats().compiled_paths, 1u);
  EXPECT_GE(optimizer->stats().path_cache_hits, 1u);
}
