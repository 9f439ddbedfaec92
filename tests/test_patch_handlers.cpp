#include <gtest/gtest.h>

#include <string>

#include "xml_document.hpp"
#include "kernel/patch_handlers.hpp"

using oxp::ErrorSeverity;
using oxp::HandlerContext;
using oxp::HandlerOutcome;
using oxp::InsertPosition;
using oxp::MergeStrategy;
using oxp::NamespaceResolver;
using oxp::NodeSet;
using oxp::PatchErrc;
using oxp::PatchFault;
using oxp::PatchKind;
using oxp::PatchOperation;
using oxp::PatchResult;
using oxp::PatchValue;
using oxp::ResolutionScope;
using oxp::XmlDocument;

namespace {

const char* kWordDoc =
    "<w:document xmlns:w=\"urn:w\"><w:body>"
    "<w:p w:rsid=\"1\"><w:r><w:t>Hello</w:t></w:r></w:p>"
    "</w:body></w:document>";

// One document with a scope and handler context built over it.
struct Fixture {
  explicit Fixture(const std::string& xml)
      : doc(XmlDocument::parse(xml)),
        scope(doc, resolver.effective_namespaces(doc, {}, {})),
        ctx{doc, scope, resolver} {}

  HandlerOutcome run(const PatchOperation& op) { return oxp::handlers::dispatch(op, ctx); }

  size_t count(const std::string& target) {
    auto outcome = resolver.resolve(target, scope);
    return std::get<NodeSet>(outcome).size();
  }

  std::string text_of(const std::string& target) {
    auto outcome = resolver.resolve(target, scope);
    const NodeSet& nodes = std::get<NodeSet>(outcome);
    return nodes.empty() ? std::string() : oxp::node_text(nodes[0]);
  }

  NamespaceResolver resolver;
  XmlDocument doc;
  ResolutionScope scope;
  HandlerContext ctx;
};

PatchOperation make(PatchKind kind, const std::string& target, PatchValue value,
                    InsertPosition position = InsertPosition::Append,
                    MergeStrategy strategy = MergeStrategy::Update) {
  PatchOperation::Options options;
  options.position = position;
  options.merge_strategy = strategy;
  return PatchOperation::create(kind, target, std::move(value), options);
}

const PatchResult& result_of(const HandlerOutcome& outcome) {
  return std::get<PatchResult>(outcome);
}

}  // namespace

TEST(SetHandlerTest, ReplacesElementTextAndBumpsRevision) {
  Fixture f(kWordDoc);
  const auto before = f.doc.revision();
  auto outcome = f.run(make(PatchKind::Set, "//w:t", PatchValue::text("World")));
  ASSERT_TRUE(std::holds_alternative<PatchResult>(outcome));
  EXPECT_TRUE(result_of(outcome).success);
  EXPECT_EQ(result_of(outcome).affected_elements, 1);
  EXPECT_EQ(f.text_of("//w:t"), "World");
  EXPECT_GT(f.doc.revision(), before);
}

TEST(SetHandlerTest, WritesAttributeValues) {
  Fixture f(kWordDoc);
  auto outcome = f.run(make(PatchKind::Set, "//w:p/@w:rsid", PatchValue::text("2")));
  EXPECT_TRUE(result_of(outcome).success);
  EXPECT_NE(f.doc.to_string().find("w:rsid=\"2\""), std::string::npos);
}

TEST(SetHandlerTest, KeepsChildElementsWhenReplacingText) {
  Fixture f("<root xmlns:a=\"urn:a\"><a:p>old<a:r/>tail</a:p></root>");
  f.run(make(PatchKind::Set, "//a:p", PatchValue::text("new")));
  EXPECT_NE(f.doc.to_string().find("<a:p>new<a:r/>tail</a:p>"), std::string::npos);
}

TEST(SetHandlerTest, ReportsMismatchAndMissingTargets) {
  Fixture f(kWordDoc);
  auto list = f.run(make(PatchKind::Set, "//w:t", PatchValue::list({PatchValue::text("a")})));
  ASSERT_TRUE(std::holds_alternative<PatchFault>(list));
  EXPECT_EQ(std::get<PatchFault>(list).code, PatchErrc::TypeMismatch);

  const auto before = f.doc.revision();
  auto none = f.run(make(PatchKind::Set, "//w:tbl", PatchValue::text("x")));
  const PatchResult& r = result_of(none);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.severity, ErrorSeverity::Warning);
  ASSERT_TRUE(r.exception_info.has_value());
  EXPECT_EQ(r.exception_info->code, PatchErrc::TargetNotFound);
  EXPECT_EQ(f.doc.revision(), before);
}

TEST(InsertHandlerTest, AppendsFragmentsAsChildren) {
  Fixture f(kWordDoc);
  auto outcome = f.run(make(PatchKind::Insert, "//w:body",
                            PatchValue::fragment("<w:p xmlns:w=\"urn:w\"><w:t>Second</w:t></w:p>")));
  EXPECT_TRUE(result_of(outcome).success);
  EXPECT_EQ(f.count("//w:body/w:p"), 2u);
  EXPECT_EQ(f.text_of("//w:body/w:p[2]/w:t"), "Second");
}

TEST(InsertHandlerTest, PrependsTagMappings) {
  Fixture f(kWordDoc);
  auto value = PatchValue::mapping({{"tag", PatchValue::text("w:p")}, {"text", PatchValue::text("first")}});
  auto outcome = f.run(make(PatchKind::Insert, "//w:body", value, InsertPosition::Prepend));
  EXPECT_TRUE(result_of(outcome).success);
  EXPECT_EQ(f.text_of("//w:body/w:p[1]"), "first");
  EXPECT_EQ(f.count("//w:body/w:p"), 2u);
}

TEST(InsertHandlerTest, PlainTextBecomesTextElementSibling) {
  Fixture f(kWordDoc);
  auto outcome = f.run(make(PatchKind::Insert, "//w:p", PatchValue::text("x"), InsertPosition::Before));
  EXPECT_TRUE(result_of(outcome).success);
  EXPECT_NE(f.doc.to_string().find("<w:body><text>x</text><w:p"), std::string::npos);
}

TEST(InsertHandlerTest, SkipsSiblingInsertAroundRoot) {
  Fixture f(kWordDoc);
  auto outcome = f.run(make(PatchKind::Insert, "/w:document", PatchValue::text("x"), InsertPosition::After));
  const PatchResult& r = result_of(outcome);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.severity, ErrorSeverity::Warning);
  ASSERT_EQ(r.warnings.size(), 1u);
  EXPECT_EQ(r.warnings[0], "Cannot insert after the root element");
}

TEST(InsertHandlerTest, RejectsBrokenFragmentsAndUnknownPrefixes) {
  Fixture f(kWordDoc);
  const auto before = f.doc.to_string();

  auto unbound = f.run(make(PatchKind::Insert, "//w:body", PatchValue::fragment("<w:p><w:t/></w:p>")));
  ASSERT_TRUE(std::holds_alternative<PatchFault>(unbound));
  EXPECT_EQ(std::get<PatchFault>(unbound).code, PatchErrc::FragmentSyntax);

  auto unclosed = f.run(make(PatchKind::Insert, "//w:body", PatchValue::fragment("<p>")));
  ASSERT_TRUE(std::holds_alternative<PatchFault>(unclosed));
  EXPECT_EQ(std::get<PatchFault>(unclosed).code, PatchErrc::FragmentSyntax);

  auto unknown = f.run(make(PatchKind::Insert, "//w:body", PatchValue::mapping({{"tag", PatchValue::text("q:x")}})));
  ASSERT_TRUE(std::holds_alternative<PatchFault>(unknown));
  EXPECT_EQ(std::get<PatchFault>(unknown).code, PatchErrc::Namespace);

  EXPECT_EQ(f.doc.to_string(), before);
}

TEST(ExtendHandlerTest, AppendsEveryItemInOrder) {
  Fixture f(kWordDoc);
  auto items = PatchValue::list({
      PatchValue::text("a"),
      PatchValue::mapping({{"tag", PatchValue::text("w:p")}, {"@w:id", PatchValue::text("7")}}),
      PatchValue::fragment("<w:t xmlns:w=\"urn:w\">f</w:t>"),
  });
  auto outcome = f.run(make(PatchKind::Extend, "//w:body", items));
  const PatchResult& r = result_of(outcome);
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.affected_elements, 3);
  EXPECT_EQ(r.message, "Extended 1 element(s) with 3 item(s)");

  const std::string xml = f.doc.to_string();
  EXPECT_NE(xml.find("<item>a</item>"), std::string::npos);
  EXPECT_NE(xml.find("w:id=\"7\""), std::string::npos);
  EXPECT_EQ(f.text_of("//w:body/w:t"), "f");
  EXPECT_LT(xml.find("<item>a</item>"), xml.find("w:id=\"7\""));
}

TEST(ExtendHandlerTest, RequiresAListValue) {
  Fixture f(kWordDoc);
  auto outcome = f.run(make(PatchKind::Extend, "//w:body", PatchValue::text("x")));
  const PatchResult& r = result_of(outcome);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.severity, ErrorSeverity::Error);
  EXPECT_NE(r.message.find("Type mismatch"), std::string::npos);
  EXPECT_EQ(r.exception_info->code, PatchErrc::TypeMismatch);
}

TEST(ExtendHandlerTest, NamesTheBrokenListItem) {
  Fixture f(kWordDoc);
  auto outcome = f.run(make(PatchKind::Extend, "//w:body",
                            PatchValue::list({PatchValue::text("ok"), PatchValue::fragment("<a><b></a>")})));
  ASSERT_TRUE(std::holds_alternative<PatchFault>(outcome));
  EXPECT_EQ(std::get<PatchFault>(outcome).message.rfind("List item 1: ", 0), 0u);
  EXPECT_EQ(f.count("//w:body/item"), 0u);
}

TEST(MergeHandlerTest, UpdateOverwritesAttributesAndText) {
  Fixture f("<root xmlns:w=\"urn:w\"><w:p w:a=\"1\">x<w:r/></w:p></root>");
  auto value = PatchValue::mapping({
      {"@w:a", PatchValue::text("2")},
      {"@b", PatchValue::text("3")},
      {"text", PatchValue::text("y")},
      {"style", PatchValue::text("ignored")},
  });
  auto outcome = f.run(make(PatchKind::Merge, "//w:p", value));
  const PatchResult& r = result_of(outcome);
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.affected_elements, 1);
  ASSERT_EQ(r.warnings.size(), 1u);
  EXPECT_EQ(r.warnings[0], "Ignored merge key 'style': expected '@attribute' or 'text'");
  EXPECT_NE(f.doc.to_string().find("<w:p w:a=\"2\" b=\"3\">y<w:r/></w:p>"), std::string::npos);
}

TEST(MergeHandlerTest, AppendJoinsWithExistingValues) {
  Fixture f("<root xmlns:w=\"urn:w\"><w:p w:a=\"1\">x</w:p></root>");
  auto value = PatchValue::mapping({
      {"@w:a", PatchValue::text("2")},
      {"@c", PatchValue::text("new")},
      {"text", PatchValue::text("z")},
  });
  auto outcome = f.run(make(PatchKind::Merge, "//w:p", value, InsertPosition::Append, MergeStrategy::Append));
  EXPECT_TRUE(result_of(outcome).success);
  EXPECT_EQ(result_of(outcome).message, "Merged 3 key(s) into 1 element(s) (append)");
  EXPECT_NE(f.doc.to_string().find("<w:p w:a=\"1 2\" c=\"new\">x z</w:p>"), std::string::npos);
}

TEST(MergeHandlerTest, UnknownPrefixLeavesTreeUntouched) {
  Fixture f("<root xmlns:w=\"urn:w\"><w:p w:a=\"1\"/></root>");
  const auto before = f.doc.revision();
  auto value = PatchValue::mapping({{"@w:a", PatchValue::text("2")}, {"@q:x", PatchValue::text("3")}});
  auto outcome = f.run(make(PatchKind::Merge, "//w:p", value));
  ASSERT_TRUE(std::holds_alternative<PatchFault>(outcome));
  EXPECT_EQ(std::get<PatchFault>(outcome).code, PatchErrc::Namespace);
  EXPECT_EQ(f.doc.revision(), before);
  EXPECT_NE(f.doc.to_string().find("w:a=\"1\""), std::string::npos);

  auto list = f.run(make(PatchKind::Merge, "//w:p", PatchValue::list({PatchValue::text("x")})));
  EXPECT_EQ(result_of(list).exception_info->code, PatchErrc::TypeMismatch);
}

TEST(RelationshipHandlerTest, ValidatesDescriptorWithoutTouchingTree) {
  Fixture f(kWordDoc);
  const auto before = f.doc.revision();
  auto good = f.run(make(PatchKind::RelationshipAdd, "/Relationships",
                         PatchValue::mapping({
                             {"Id", PatchValue::text("rId9")},
                             {"Type", PatchValue::text("http://example.com/rel/image")},
                             {"Target", PatchValue::text("media/image1.png")},
                         })));
  const PatchResult& ok = result_of(good);
  EXPECT_TRUE(ok.success);
  EXPECT_EQ(ok.severity, ErrorSeverity::Info);
  EXPECT_EQ(ok.affected_elements, 0);
  EXPECT_EQ(f.doc.revision(), before);

  auto missing = f.run(make(PatchKind::RelationshipAdd, "/Relationships",
                            PatchValue::mapping({{"Id", PatchValue::text("rId9")}})));
  const PatchResult& bad = result_of(missing);
  EXPECT_FALSE(bad.success);
  EXPECT_EQ(bad.severity, ErrorSeverity::Error);
  EXPECT_EQ(bad.exception_info->code, PatchErrc::Validation);
  EXPECT_NE(bad.message.find("Type, Target"), std::string::npos);

  auto mode = f.run(make(PatchKind::RelationshipAdd, "/Relationships",
                         PatchValue::mapping({
                             {"Id", PatchValue::text("rId9")},
                             {"Type", PatchValue::text("t")},
                             {"Target", PatchValue::text("x")},
                             {"TargetMode", PatchValue::text("Sideways")},
                         })));
  EXPECT_FALSE(result_of(mode).success);
}
