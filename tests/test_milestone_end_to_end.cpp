#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "patch_file.hpp"
#include "xml_document.hpp"
#include "kernel/patch_processor.hpp"

// Helper for asserting conditions
void oxp_assert(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "Assertion failed: " << message << std::endl;
    std::exit(1);
  }
}

namespace {

const char* kSlide =
    "<p:sld xmlns:p=\"http://schemas.openxmlformats.org/presentationml/2006/main\""
    " xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\">"
    "<p:cSld><p:spTree>"
    "<p:sp><p:txBody><a:p><a:r><a:t>Title</a:t></a:r></a:p></p:txBody></p:sp>"
    "</p:spTree></p:cSld></p:sld>";

const char* kWordDoc =
    "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
    "<w:body><w:p><w:r><w:t>Hello</w:t></w:r></w:p></w:body></w:document>";

const char* kBrandPatch = R"(
version: "1.0"
description: Slide title refresh
target_formats: [pptx]
variables:
  title: Quarterly Review
patches:
  - operation: set
    target: //a:t
    value: "${title}"
  - operation: merge
    target: //a:r
    value:
      "@lang": en-US
  - operation: extend
    target: //p:spTree
    value:
      - tag: p:sp
        "@id": "2"
      - "<p:sp xmlns:p='http://schemas.openxmlformats.org/presentationml/2006/main'><p:nvSpPr/></p:sp>"
  - operation: relsAdd
    target: /Relationships
    value:
      Id: rId2
      Type: http://schemas.openxmlformats.org/officeDocument/2006/relationships/image
      Target: ../media/image1.png
)";

}  // namespace

void test_patch_file_to_patched_slide() {
  std::cout << "--- Running test: test_patch_file_to_patched_slide ---\n";
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "ooxpatch_milestone_brand.yaml";
  {
    std::ofstream out(path);
    out << kBrandPatch;
  }

  oxp::PatchFileParser parser(oxp::ValidationLevel::Strict);
  oxp::PatchFileResult file = parser.parse_file(path);
  std::filesystem::remove(path);
  oxp_assert(file.success, "Strict parse of the brand patch should succeed");
  oxp_assert(file.operations.size() == 4, "Brand patch should contain four operations");
  oxp_assert(parser.validate_targets(file).empty(), "All brand patch targets should compile");

  oxp::ProcessorOptions options;
  options.quiet = true;
  oxp::PatchProcessor processor(options);
  oxp::XmlDocument doc = oxp::XmlDocument::parse(kSlide, "slide1.xml");
  std::vector<oxp::PatchResult> results = processor.process(doc, file.operations);

  oxp_assert(results.size() == 4, "One result per operation");
  for (const auto& r : results) {
    oxp_assert(r.success, "Operation failed: " + r.message);
  }
  const std::string xml = doc.to_string();
  oxp_assert(xml.find("<a:t>Quarterly Review</a:t>") != std::string::npos, "Title text should be replaced");
  oxp_assert(xml.find("lang=\"en-US\"") != std::string::npos, "Run should carry the merged attribute");
  oxp_assert(xml.find("<p:nvSpPr/>") != std::string::npos, "Fragment item should be appended");
  oxp_assert(results[2].affected_elements == 2, "Extend should append two shapes");
  oxp_assert(results[3].affected_elements == 0, "relsAdd never touches the part");
  oxp_assert(processor.validate_integrity(doc).valid, "Patched slide should keep its structure");

  std::cout << "PASS\n";
}

void test_recovery_keeps_run_going() {
  std::cout << "--- Running test: test_recovery_keeps_run_going ---\n";
  oxp::ProcessorOptions options;
  options.quiet = true;
  options.recovery = oxp::RecoveryStrategy::RetryWithFallback;
  oxp::PatchProcessor processor(options);

  std::vector<oxp::PatchOperation> ops{
      // Fragment relies on the document's w prefix without declaring it.
      oxp::PatchOperation::create(oxp::PatchKind::Insert, "//w:body",
                                  oxp::PatchValue::fragment("<w:p><w:r><w:t>Added</w:t></w:r></w:p>")),
      oxp::PatchOperation::create(oxp::PatchKind::Set, "(//Word:t)[1]", oxp::PatchValue::text("Hi")),
      oxp::PatchOperation::create(oxp::PatchKind::Set, "//w:tbl", oxp::PatchValue::text("none")),
  };

  std::vector<oxp::PatchResult> results;
  const std::string xml = processor.process_xml(kWordDoc, ops, {}, &results);
  oxp_assert(results.size() == 3, "Every operation should be reported");
  oxp_assert(results[0].success && results[0].fallback_applied, "Fragment should be repaired");
  oxp_assert(results[0].recovery_strategy_used == "retry_with_fallback:fragment_repair",
            "Fragment repair should be recorded");
  oxp_assert(results[1].success && results[1].fallback_applied, "Aliased prefix should be corrected");
  oxp_assert(!results[2].success && results[2].severity == oxp::ErrorSeverity::Warning,
            "Missing target is only a warning");
  oxp_assert(xml.find("Added") != std::string::npos, "Inserted paragraph should be present");
  oxp_assert(xml.find("<w:t>Hi</w:t>") != std::string::npos, "Corrected target should be patched");

  oxp::ProcessorStats stats = processor.stats();
  oxp_assert(stats.recovery.successful_recoveries == 2, "Two recoveries expected");
  oxp_assert(stats.operations_applied == 2, "Two operations applied");

  std::cout << "PASS\n";
}

void test_shared_processor_across_threads() {
  std::cout << "--- Running test: test_shared_processor_across_threads ---\n";
  oxp::ProcessorOptions options;
  options.quiet = true;
  oxp::PatchProcessor processor(options);

  const size_t workers = 4;
  std::vector<oxp::XmlDocument> docs;
  for (size_t i = 0; i < workers; ++i) docs.push_back(oxp::XmlDocument::parse(kSlide));

  std::vector<oxp::PatchOperation> ops{
      oxp::PatchOperation::create(oxp::PatchKind::Set, "//a:t", oxp::PatchValue::text("Threaded")),
      oxp::PatchOperation::create(oxp::PatchKind::Insert, "//p:spTree",
                                  oxp::PatchValue::mapping({{"tag", oxp::PatchValue::text("p:sp")}})),
  };

  std::vector<int> applied(workers, 0);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < workers; ++i) {
    threads.emplace_back([&, i]() {
      for (const auto& r : processor.process(docs[i], ops)) {
        if (r.success) ++applied[i];
      }
    });
  }
  for (auto& t : threads) t.join();

  for (size_t i = 0; i < workers; ++i) {
    oxp_assert(applied[i] == 2, "Every document should get both operations");
    oxp_assert(docs[i].to_string().find("<a:t>Threaded</a:t>") != std::string::npos, "Text should be set");
  }
  oxp_assert(processor.stats().operations_processed == workers * ops.size(), "All operations counted");
  oxp_assert(processor.resolver().stats().active_sessions == 0, "Sessions should be released");

  std::cout << "PASS\n";
}

int main() {
  try {
    test_patch_file_to_patched_slide();
    test_recovery_keeps_run_going();
    test_shared_processor_across_threads();

    std::cout << "\nAll end-to-end tests passed!\n";
  } catch (const std::exception& e) {
    std::cerr << "\nEnd-to-end test suite failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
