#include "urlform/form-pairs.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

#include "urlform/form-container.hpp"
#include "urlform/form-error.hpp"

namespace urlform {

namespace {

FormContainer Scalar(const char* value) { return FormContainer::scalar(value); }

FormContainer Strings(std::initializer_list<const char*> values) {
  FormContainer::Sequence elements;
  for (const char* value : values) {
    elements.push_back(FormContainer::scalar(value));
  }
  return FormContainer::sequence(std::move(elements));
}

// {name: "John", tags: ["a", "b"]}
FormContainer NameAndTags() {
  FormContainer root = FormContainer::mapping();
  root.set("name", Scalar("John"));
  root.set("tags", Strings({"a", "b"}));
  return root;
}

}  // namespace

TEST(FormPairs, ArrayStyleNames) {
  EXPECT_EQ(ArrayStyleName(ArrayStyle::AccumulateValues), "accumulateValues");
  EXPECT_EQ(ArrayStyleName(ArrayStyle::Brackets), "brackets");
  EXPECT_EQ(ArrayStyleName(ArrayStyle::BracketsWithIndices), "bracketsWithIndices");
}

TEST(FormPairs, PairKey) {
  EXPECT_EQ((FormPair{{"user", "pets", "", "name"}, "x"}).key(), "user[pets][][name]");
  EXPECT_EQ((FormPair{{"name"}, "x"}).key(), "name");
  EXPECT_EQ(FormPair{}.key(), "");
}

TEST(FormPairs, SplitKeySegments) {
  EXPECT_EQ(SplitKeySegments("name"), (std::vector<std::string>{"name"}));
  EXPECT_EQ(SplitKeySegments("tags[]"), (std::vector<std::string>{"tags", ""}));
  EXPECT_EQ(SplitKeySegments("tags[0]"), (std::vector<std::string>{"tags", "0"}));
  EXPECT_EQ(SplitKeySegments("user[pets][1][name]"), (std::vector<std::string>{"user", "pets", "1", "name"}));
}

TEST(FormPairs, SplitKeySegmentsMalformed) {
  EXPECT_EQ(SplitKeySegments("tags[0"), (std::vector<std::string>{"tags", "0"}));
  EXPECT_EQ(SplitKeySegments("a[b]junk[c]"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(SplitKeySegments("a]b"), (std::vector<std::string>{"a]b"}));
  EXPECT_EQ(SplitKeySegments("[x]"), (std::vector<std::string>{"", "x"}));
}

TEST(FormPairs, SplitSkipsEmptyFields) {
  const auto pairs = SplitFormPairs("&a=1&&b=2&", ArrayStyle::AccumulateValues);
  ASSERT_EQ(pairs.size(), 2U);
  EXPECT_EQ(pairs[0], (FormPair{{"a"}, "1"}));
  EXPECT_EQ(pairs[1], (FormPair{{"b"}, "2"}));
  EXPECT_TRUE(SplitFormPairs("", ArrayStyle::Brackets).empty());
}

TEST(FormPairs, SplitOnFirstEqualOnly) {
  const auto pairs = SplitFormPairs("expr=a=b&flag&empty=", ArrayStyle::AccumulateValues);
  ASSERT_EQ(pairs.size(), 3U);
  EXPECT_EQ(pairs[0].value, "a=b");
  EXPECT_EQ(pairs[1], (FormPair{{"flag"}, ""}));
  EXPECT_EQ(pairs[2], (FormPair{{"empty"}, ""}));
}

TEST(FormPairs, SplitPercentDecodes) {
  const auto pairs = SplitFormPairs("full+name=John+Doe&q=a%3Db%26c&t%5B0%5D=x", ArrayStyle::BracketsWithIndices);
  ASSERT_EQ(pairs.size(), 3U);
  EXPECT_EQ(pairs[0], (FormPair{{"full name"}, "John Doe"}));
  EXPECT_EQ(pairs[1], (FormPair{{"q"}, "a=b&c"}));
  EXPECT_EQ(pairs[2], (FormPair{{"t", "0"}, "x"}));
}

TEST(FormPairs, SplitKeepsMalformedEscapes) {
  const auto pairs = SplitFormPairs("a=100%&b=%zz&c=%4", ArrayStyle::AccumulateValues);
  ASSERT_EQ(pairs.size(), 3U);
  EXPECT_EQ(pairs[0].value, "100%");
  EXPECT_EQ(pairs[1].value, "%zz");
  EXPECT_EQ(pairs[2].value, "%4");
}

TEST(FormPairs, SplitAccumulateKeepsWholeKey) {
  const auto pairs = SplitFormPairs("tags[0]=a", ArrayStyle::AccumulateValues);
  ASSERT_EQ(pairs.size(), 1U);
  EXPECT_EQ(pairs[0].path, (std::vector<std::string>{"tags[0]"}));
}

TEST(FormPairs, JoinEncodesSegmentsAndKeepsBrackets) {
  const std::vector<FormPair> pairs{{{"q"}, "a=b&c"}, {{"tags", "0"}, "x y"}, {{"user", "full name"}, "~"}};
  EXPECT_EQ(JoinFormPairs(pairs), "q=a%3Db%26c&tags[0]=x+y&user[full+name]=%7E");
}

TEST(FormPairs, JoinBareValues) {
  const std::vector<FormPair> pairs{{{}, "a b"}, {{}, "c"}};
  EXPECT_EQ(JoinFormPairs(pairs), "a+b&c");
  EXPECT_EQ(JoinFormPairs({}), "");
}

TEST(FormPairs, FlattenAccumulate) {
  EXPECT_EQ(SerializeFormContainer(NameAndTags(), ArrayStyle::AccumulateValues), "name=John&tags=a&tags=b");
}

TEST(FormPairs, FlattenBrackets) {
  EXPECT_EQ(SerializeFormContainer(NameAndTags(), ArrayStyle::Brackets), "name=John&tags[]=a&tags[]=b");
}

TEST(FormPairs, FlattenBracketsWithIndices) {
  EXPECT_EQ(SerializeFormContainer(NameAndTags(), ArrayStyle::BracketsWithIndices), "name=John&tags[0]=a&tags[1]=b");
}

TEST(FormPairs, FlattenNestedMapping) {
  FormContainer address = FormContainer::mapping();
  address.set("city", Scalar("Paris"));
  FormContainer root = FormContainer::mapping();
  root.set("address", std::move(address));
  EXPECT_EQ(SerializeFormContainer(root, ArrayStyle::AccumulateValues), "address[city]=Paris");
  EXPECT_EQ(SerializeFormContainer(root, ArrayStyle::BracketsWithIndices), "address[city]=Paris");
}

TEST(FormPairs, FlattenSequenceOfMappings) {
  FormContainer pet = FormContainer::mapping();
  pet.set("name", Scalar("Rex"));
  pet.set("age", Scalar("3"));
  FormContainer root = FormContainer::mapping();
  root.set("pets", FormContainer::sequence({pet, pet}));

  EXPECT_EQ(SerializeFormContainer(root, ArrayStyle::BracketsWithIndices),
            "pets[0][name]=Rex&pets[0][age]=3&pets[1][name]=Rex&pets[1][age]=3");
  EXPECT_EQ(SerializeFormContainer(root, ArrayStyle::Brackets),
            "pets[][name]=Rex&pets[][age]=3&pets[][name]=Rex&pets[][age]=3");
}

TEST(FormPairs, FlattenAccumulateRejectsNestedContainersInSequence) {
  FormContainer root = FormContainer::mapping();
  root.set("matrix", FormContainer::sequence({Strings({"1", "2"})}));
  try {
    (void)FlattenFormContainer(root, ArrayStyle::AccumulateValues);
    FAIL() << "Expected EncodingError";
  } catch (const EncodingError& ex) {
    EXPECT_EQ(ex.reason(), EncodingError::Reason::UnrepresentableValue);
    EXPECT_EQ(ex.codingPath(), (CodingPath{"matrix", "0"}));
  }
}

TEST(FormPairs, FlattenEmptyCollectionsProduceNothing) {
  FormContainer root = FormContainer::mapping();
  root.set("tags", FormContainer::sequence());
  root.set("attributes", FormContainer::mapping());
  root.set("name", Scalar("x"));
  EXPECT_EQ(SerializeFormContainer(root, ArrayStyle::BracketsWithIndices), "name=x");
  EXPECT_EQ(SerializeFormContainer(FormContainer::mapping(), ArrayStyle::Brackets), "");
}

TEST(FormPairs, FlattenRootScalarAndSequence) {
  EXPECT_EQ(SerializeFormContainer(Scalar("hello world"), ArrayStyle::AccumulateValues), "hello+world");
  EXPECT_EQ(SerializeFormContainer(Strings({"a", "b"}), ArrayStyle::Brackets), "a&b");

  FormContainer point = FormContainer::mapping();
  point.set("x", Scalar("1"));
  const FormContainer root = FormContainer::sequence({Scalar("a"), point});
  EXPECT_EQ(SerializeFormContainer(root, ArrayStyle::BracketsWithIndices), "a&1[x]=1");
  EXPECT_THROW((void)FlattenFormContainer(root, ArrayStyle::AccumulateValues), EncodingError);
}

TEST(FormPairs, BuildAccumulateGroupsRepeatedKeys) {
  const FormContainer root = ParseFormBody("tags=a&name=John&tags=b&tags=c", ArrayStyle::AccumulateValues);
  ASSERT_TRUE(root.isMapping());
  ASSERT_EQ(root.size(), 2U);
  EXPECT_EQ(root.entries()[0].first, "tags");
  EXPECT_EQ(*root.find("tags"), Strings({"a", "b", "c"}));
  EXPECT_EQ(*root.find("name"), Scalar("John"));
}

TEST(FormPairs, BuildAccumulateIsFlat) {
  const FormContainer root = ParseFormBody("address[city]=Paris", ArrayStyle::AccumulateValues);
  ASSERT_NE(root.find("address[city]"), nullptr);
  EXPECT_EQ(root.find("address"), nullptr);
}

TEST(FormPairs, BuildBracketsAppendsInOrder) {
  const FormContainer root = ParseFormBody("tags[]=a&tags[]=b&name=x", ArrayStyle::Brackets);
  EXPECT_EQ(*root.find("tags"), Strings({"a", "b"}));
  EXPECT_EQ(*root.find("name"), Scalar("x"));
}

TEST(FormPairs, BuildIndicesOutOfOrder) {
  const FormContainer root = ParseFormBody("tags[2]=c&tags[0]=a&tags[1]=b", ArrayStyle::BracketsWithIndices);
  EXPECT_EQ(*root.find("tags"), Strings({"a", "b", "c"}));
}

TEST(FormPairs, BuildIndicesCompactsGaps) {
  const FormContainer root = ParseFormBody("tags[7]=b&tags[3]=a", ArrayStyle::BracketsWithIndices);
  EXPECT_EQ(*root.find("tags"), Strings({"a", "b"}));
}

TEST(FormPairs, BuildIndicesRepeatedIndexLastWins) {
  const FormContainer root = ParseFormBody("tags[0]=a&tags[0]=b", ArrayStyle::BracketsWithIndices);
  EXPECT_EQ(*root.find("tags"), Strings({"b"}));
}

TEST(FormPairs, BuildMixedUnkeyedAndIndexed) {
  EXPECT_EQ(*ParseFormBody("tags[]=first&tags[1]=second", ArrayStyle::Brackets).find("tags"),
            Strings({"first", "second"}));
  EXPECT_EQ(*ParseFormBody("tags[5]=x&tags[]=y&tags[0]=z", ArrayStyle::BracketsWithIndices).find("tags"),
            Strings({"z", "x", "y"}));
}

TEST(FormPairs, BuildSequenceOfMappingsWithIndices) {
  const FormContainer root =
      ParseFormBody("pets[1][name]=Tom&pets[0][name]=Rex&pets[0][age]=3", ArrayStyle::BracketsWithIndices);
  const FormContainer* pets = root.find("pets");
  ASSERT_NE(pets, nullptr);
  ASSERT_TRUE(pets->isSequence());
  ASSERT_EQ(pets->size(), 2U);
  EXPECT_EQ(*pets->elements()[0].find("name"), Scalar("Rex"));
  EXPECT_EQ(*pets->elements()[0].find("age"), Scalar("3"));
  EXPECT_EQ(*pets->elements()[1].find("name"), Scalar("Tom"));
}

TEST(FormPairs, BuildNumericSegmentUnderObjectStaysKey) {
  const FormContainer root = ParseFormBody("codes[us]=1&codes[33]=2", ArrayStyle::BracketsWithIndices);
  const FormContainer* codes = root.find("codes");
  ASSERT_NE(codes, nullptr);
  ASSERT_TRUE(codes->isMapping());
  EXPECT_EQ(*codes->find("33"), Scalar("2"));
}

TEST(FormPairs, BuildNumericRootFieldIsKey) {
  const FormContainer root = ParseFormBody("0=a&1=b", ArrayStyle::BracketsWithIndices);
  ASSERT_TRUE(root.isMapping());
  EXPECT_EQ(*root.find("0"), Scalar("a"));
  EXPECT_EQ(*root.find("1"), Scalar("b"));
}

TEST(FormPairs, BuildLastWrittenFormWins) {
  const FormContainer root = ParseFormBody("a=1&a[b]=2", ArrayStyle::Brackets);
  const FormContainer* node = root.find("a");
  ASSERT_NE(node, nullptr);
  ASSERT_TRUE(node->isMapping());
  EXPECT_EQ(*node->find("b"), Scalar("2"));
}

TEST(FormPairs, BuildTooLongIndexIsKey) {
  const FormContainer root = ParseFormBody("a[1234567890123456789]=x", ArrayStyle::BracketsWithIndices);
  const FormContainer* node = root.find("a");
  ASSERT_NE(node, nullptr);
  EXPECT_TRUE(node->isMapping());
}

TEST(FormPairs, BuildDeeplyNestedKeyIsBounded) {
  static constexpr std::size_t kNbSegments = 200000;
  std::string body("a");
  for (std::size_t pos = 0; pos < kNbSegments; ++pos) {
    body.append("[]");
  }
  body.append("=x");

  const FormContainer root = ParseFormBody(body, ArrayStyle::Brackets);
  const FormContainer* node = root.find("a");
  ASSERT_NE(node, nullptr);
  std::size_t depth = 0;
  while (node->isSequence()) {
    ASSERT_EQ(node->size(), 1U);
    node = &node->elements().front();
    ++depth;
  }
  EXPECT_EQ(depth, 63U);
  ASSERT_TRUE(node->isMapping());
  ASSERT_EQ(node->entries().size(), 1U);
  const auto& [literalKey, leaf] = node->entries().front();
  EXPECT_EQ(literalKey.size(), 2U * (kNbSegments - depth - 1U));
  EXPECT_TRUE(literalKey.starts_with("[][]"));
  EXPECT_EQ(leaf, FormContainer::scalar("x"));
}

TEST(FormPairs, BuildNestingUpToLimitIsStructured) {
  std::string body("a");
  for (int pos = 0; pos < 64; ++pos) {
    body.append("[0]");
  }
  body.append("=x");

  const FormContainer root = ParseFormBody(body, ArrayStyle::BracketsWithIndices);
  const FormContainer* node = root.find("a");
  ASSERT_NE(node, nullptr);
  std::size_t depth = 0;
  while (node->isSequence()) {
    node = &node->elements().front();
    ++depth;
  }
  EXPECT_EQ(depth, 64U);
  EXPECT_EQ(*node, FormContainer::scalar("x"));
}

TEST(FormPairs, BuildEmptyBody) {
  EXPECT_EQ(ParseFormBody("", ArrayStyle::BracketsWithIndices), FormContainer::mapping());
  EXPECT_EQ(ParseFormBody("&&", ArrayStyle::AccumulateValues), FormContainer::mapping());
}

TEST(FormPairs, PercentExactness) {
  FormContainer root = FormContainer::mapping();
  root.set("q", Scalar("a=b&c"));
  root.set("s", Scalar("hello world"));
  root.set("t", Scalar("~"));
  const std::string body = SerializeFormContainer(root, ArrayStyle::AccumulateValues);
  EXPECT_EQ(body, "q=a%3Db%26c&s=hello+world&t=%7E");
  EXPECT_EQ(ParseFormBody(body, ArrayStyle::AccumulateValues), root);
}

}  // namespace urlform
