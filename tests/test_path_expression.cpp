#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kernel/services/path_expression.hpp"

namespace path = oxp::path;

TEST(PathExpressionTest, ReferencedPrefixesInOrderOfFirstUse) {
  EXPECT_EQ(path::referenced_prefixes("//p:sp[a:off]/@r:id"),
            (std::vector<std::string>{"p", "a", "r"}));
  EXPECT_EQ(path::referenced_prefixes("//w:p/w:r/w:t"), (std::vector<std::string>{"w"}));
  EXPECT_TRUE(path::referenced_prefixes("//item[@id='x:y']").empty());
}

TEST(PathExpressionTest, LocalNameFormRewritesNameTestsOnly) {
  EXPECT_EQ(path::to_local_name_form("//a:t"), "//*[local-name()='t']");
  EXPECT_EQ(path::to_local_name_form("//p:sp/@r:id"), "//*[local-name()='sp']/@*[local-name()='id']");
  EXPECT_EQ(path::to_local_name_form("count(//a:t)"), "count(//*[local-name()='t'])");
  EXPECT_EQ(path::to_local_name_form("//p:*"), "//*");
  // String literals and operator names are left alone.
  EXPECT_EQ(path::to_local_name_form("//a:t[. = 'a:b' and 1]"), "//*[local-name()='t'][. = 'a:b' and 1]");
}

TEST(PathExpressionTest, ReplacePrefixLeavesOtherPrefixesAlone) {
  EXPECT_EQ(path::replace_prefix("//W:t/W:r/@a:id", "W", "w"), "//w:t/w:r/@a:id");
  EXPECT_EQ(path::replace_prefix("//x:t['W:r']", "W", "w"), "//x:t['W:r']");
}

TEST(PathExpressionTest, DetectsAttributeSteps) {
  EXPECT_TRUE(path::selects_attribute("//a:t/@val"));
  EXPECT_TRUE(path::selects_attribute("//a:t/attribute::val"));
  EXPECT_FALSE(path::selects_attribute("//a:t[@val]"));
  EXPECT_FALSE(path::selects_attribute("//a:t"));

  EXPECT_EQ(path::attribute_step_name("//a:t/@r:id"), "id");
  EXPECT_EQ(path::attribute_step_name("//a:t/@*"), "*");
  EXPECT_EQ(path::attribute_step_name("//a:t"), "");
}

TEST(PathExpressionTest, NcNames) {
  EXPECT_TRUE(path::is_ncname("p14"));
  EXPECT_TRUE(path::is_ncname("ns1_2"));
  EXPECT_FALSE(path::is_ncname("1p"));
  EXPECT_FALSE(path::is_ncname("a:b"));
  EXPECT_FALSE(path::is_ncname(""));
}

TEST(PathExpressionTest, CompileReportsSyntaxErrors) {
  auto ok = path::compile("//a:t[@val='1']");
  EXPECT_TRUE(std::holds_alternative<oxp::CompiledPath>(ok));

  auto bad = path::compile("//a:t[");
  ASSERT_TRUE(std::holds_alternative<oxp::PatchFault>(bad));
  const auto& fault = std::get<oxp::PatchFault>(bad);
  EXPECT_EQ(fault.code, oxp::PatchErrc::PathSyntax);
  EXPECT_NE(fault.message.find("//a:t["), std::string::npos);

  auto empty = path::compile("");
  ASSERT_TRUE(std::holds_alternative<oxp::PatchFault>(empty));
}
