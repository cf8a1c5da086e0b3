#include <sstream>

#include <gtest/gtest.h>

#include "test_helpers.hh"

using namespace cfnorm;
using cfnorm::test::resource;
using cfnorm::test::str;

TEST(TemplateJson, UsesJsonDumpsSeparators)
{
  const ordered_node node = load_template(R"(
b: 1
a: [true, false, null, "x"]
c: {}
)");
  EXPECT_EQ(to_json(node), R"({"b": 1, "a": [true, false, null, "x"], "c": {}})");
}

TEST(TemplateJson, EscapesStrings)
{
  ordered_node node = ordered_node::mapping();
  node["quote"] = internal::make_node_from(std::string("say \"hi\"\\now\n\t"));
  node["ctl"] = internal::make_node_from(std::string("\x01"));
  EXPECT_EQ(to_json(node), R"({"quote": "say \"hi\"\\now\n\t", "ctl": "\u0001"})");
}

TEST(TemplateJson, FloatsKeepAFraction)
{
  const ordered_node node = load_template("[1.5, 2.0, -0.25]\n");
  EXPECT_EQ(to_json(node), "[1.5, 2.0, -0.25]");
}

TEST(TemplateLoad, ShortFormIntrinsics_AreExpanded)
{
  const ordered_node tmpl = load_template(R"(
Resources:
  Fn:
    Type: AWS::Lambda::Function
    Properties:
      Role: !GetAtt FnRole.Arn
      Bucket: !Ref Bucket
      Name: !Sub "${AWS::StackName}-fn"
      Layers: !Split [",", "a,b"]
      Plain: text
)");
  const ordered_node& props = resource(tmpl, "Fn").at("Properties");

  EXPECT_EQ(to_json(props.at("Role")), R"({"Fn::GetAtt": ["FnRole", "Arn"]})");
  EXPECT_EQ(to_json(props.at("Bucket")), R"({"Ref": "Bucket"})");
  EXPECT_EQ(to_json(props.at("Name")), R"({"Fn::Sub": "${AWS::StackName}-fn"})");
  EXPECT_EQ(to_json(props.at("Layers")), R"({"Fn::Split": [",", "a,b"]})");
  EXPECT_EQ(str(props.at("Plain")), "text");
}

TEST(TemplateLoad, GetAttKeepsDottedAttributeName)
{
  const ordered_node node = load_template("Value: !GetAtt Db.Endpoint.Address\n");
  EXPECT_EQ(to_json(node), R"({"Value": {"Fn::GetAtt": ["Db", "Endpoint.Address"]}})");
}

TEST(TemplateLoad, JsonTemplate_Parses)
{
  std::istringstream in(
      R"({"Resources": {"Fn": {"Type": "AWS::Lambda::Function", )"
      R"("Metadata": {"aws:asset:path": "asset.1", "aws:asset:property": "Code"}}}})");
  ordered_node tmpl = load_template(in);
  normalize(tmpl);
  EXPECT_EQ(str(resource(tmpl, "Fn").at("Properties").at("Code")), "asset.1");
}

TEST(TemplateLoad, PreservesResourceOrder)
{
  ordered_node tmpl = load_template(R"(
Resources:
  Zeta:
    Type: AWS::S3::Bucket
  Alpha:
    Type: AWS::S3::Bucket
    Metadata:
      "aws:asset:path": "a"
      "aws:asset:property": "Code"
)");
  normalize(tmpl);

  std::vector<std::string> order;
  for (const auto& [k, v] : tmpl.at("Resources").map_items()) {
    order.push_back(k.get_value<std::string>());
  }
  EXPECT_EQ(order, (std::vector<std::string>{"Zeta", "Alpha"}));
}

TEST(CdkDetection, RecognizesSynthesizedTemplates)
{
  EXPECT_TRUE(is_cdk_template(load_template(R"(
Resources:
  CDKMetadata:
    Type: AWS::CDK::Metadata
)")));
  EXPECT_TRUE(is_cdk_template(load_template(R"(
Resources:
  Bucket:
    Type: AWS::S3::Bucket
    Metadata:
      "aws:cdk:path": Stack/Bucket/Resource
)")));
  EXPECT_FALSE(is_cdk_template(load_template(R"(
Resources:
  Bucket:
    Type: AWS::S3::Bucket
    Metadata:
      "aws:cdk:path": ""
)")));
  EXPECT_FALSE(is_cdk_template(load_template("Parameters: {}\n")));
  EXPECT_FALSE(is_cdk_template(load_template("Resources: [a]\n")));
}

TEST(PathHelpers, PathlibStyleNormalization)
{
  EXPECT_EQ(internal::path_stem("src/docker/Dockerfile"), "Dockerfile");
  EXPECT_EQ(internal::path_stem("Dockerfile.prod"), "Dockerfile");
  EXPECT_EQ(internal::path_stem("docker/.dockerfile"), ".dockerfile");
  EXPECT_EQ(internal::path_stem(""), "");

  EXPECT_EQ(internal::path_parent("src/docker/Dockerfile"), "src/docker");
  EXPECT_EQ(internal::path_parent("Dockerfile"), ".");
  EXPECT_EQ(internal::path_parent("/Dockerfile"), "/");

  EXPECT_EQ(internal::path_join("src/", "docker"), "src/docker");
  EXPECT_EQ(internal::path_join("src", "."), "src");
  EXPECT_EQ(internal::path_join("", "."), ".");
  EXPECT_EQ(internal::path_join("src", "/abs/dir"), "/abs/dir");
  EXPECT_EQ(internal::path_join("./a//b/", "../c"), "a/b/../c");
}

TEST(TemplateJson, NonAsciiIsEscapedLikeEnsureAscii)
{
  ordered_node node = ordered_node::mapping();
  node["latin"] = internal::make_node_from(std::string("caf\xc3\xa9"));
  node["emoji"] = internal::make_node_from(std::string("\xf0\x9f\x98\x80"));
  EXPECT_EQ(to_json(node), R"({"latin": "caf\u00e9", "emoji": "\ud83d\ude00"})");
}

TEST(TemplateLoad, ScalarKeysKeepTheirType)
{
  const ordered_node node = load_template("1.5: a\n2: b\nname: c\n");

  std::vector<ordered_node> keys;
  for (const auto& [k, v] : node.map_items()) {
    keys.push_back(k);
  }
  ASSERT_EQ(keys.size(), 3u);
  EXPECT_TRUE(keys[0].is_float_number());
  EXPECT_TRUE(keys[1].is_integer());
  EXPECT_TRUE(keys[2].is_string());
  EXPECT_EQ(to_json(node), R"({"1.5": "a", "2": "b", "name": "c"})");
}

TEST(TemplateYaml, NormalizedParameterDefaultSurvivesReload)
{
  ordered_node tmpl = load_template(R"(
Parameters:
  AssetParametersFoo:
    Type: String
Resources:
  CDKMetadata:
    Type: AWS::CDK::Metadata
  Fn:
    Type: AWS::Lambda::Function
    Properties:
      Layers: [a, b]
      Tags:
        - Key: team
          Value: infra
    Metadata:
      "aws:asset:path": "asset.abc"
      "aws:asset:property": "Code.S3Key"
)");
  normalize(tmpl, true);

  const ordered_node reloaded = load_template(to_yaml(tmpl));
  const ordered_node& param = reloaded.at("Parameters").at("AssetParametersFoo");
  ASSERT_TRUE(param.at("Default").is_string());
  EXPECT_EQ(str(param.at("Default")), " ");
  EXPECT_TRUE(reloaded == tmpl);
}

TEST(TemplateYaml, AmbiguousStringsAreQuoted)
{
  ordered_node node = ordered_node::mapping();
  const std::vector<std::string> values = {
      " ", "", "*alias", "&anchor", "!tag", "{x", "#note", "true", "No", "null", "~",
      "123", "-1", ".inf", "trailing ", "a: b", "line\nbreak", "say \"hi\"", "plain text"};
  for (size_t i = 0; i < values.size(); ++i) {
    node["v" + std::to_string(i)] = internal::make_node_from(values[i]);
  }
  node["empty_map"] = ordered_node::mapping();
  node["nested"] = load_template("- x\n- k: 1\n  j: [2]\n");

  const std::string yaml = to_yaml(node);
  const ordered_node reloaded = load_template(yaml);
  for (size_t i = 0; i < values.size(); ++i) {
    const ordered_node& v = reloaded.at("v" + std::to_string(i));
    ASSERT_TRUE(v.is_string()) << yaml;
    EXPECT_EQ(str(v), values[i]);
  }
  EXPECT_TRUE(reloaded == node) << yaml;
  EXPECT_NE(yaml.find("v18: plain text\n"), std::string::npos);
}
