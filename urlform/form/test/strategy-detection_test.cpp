#include "urlform/strategy-detection.hpp"

#include <gtest/gtest.h>

#include "urlform/array-strategy.hpp"

namespace urlform {

TEST(StrategyDetection, IndexedKeys) {
  EXPECT_EQ(DetectArrayParsingStrategy("tags[0]=a&tags[1]=b").type(), ArrayParsingStrategy::Type::BracketsWithIndices);
  EXPECT_EQ(DetectArrayParsingStrategy("name=x&pets[0][name]=Rex").type(),
            ArrayParsingStrategy::Type::BracketsWithIndices);
}

TEST(StrategyDetection, EncodedBrackets) {
  EXPECT_EQ(DetectArrayParsingStrategy("tags%5B0%5D=a").type(), ArrayParsingStrategy::Type::BracketsWithIndices);
  EXPECT_EQ(DetectArrayParsingStrategy("tags%5B%5D=a").type(), ArrayParsingStrategy::Type::Brackets);
}

TEST(StrategyDetection, EmptyBrackets) {
  EXPECT_EQ(DetectArrayParsingStrategy("tags[]=a&tags[]=b").type(), ArrayParsingStrategy::Type::Brackets);
}

TEST(StrategyDetection, NamedBrackets) {
  EXPECT_EQ(DetectArrayParsingStrategy("user[name]=John").type(), ArrayParsingStrategy::Type::Brackets);
}

TEST(StrategyDetection, IndexAnywhereWins) {
  EXPECT_EQ(DetectArrayParsingStrategy("user[name]=John&tags[]=a&ids[3]=x").type(),
            ArrayParsingStrategy::Type::BracketsWithIndices);
}

TEST(StrategyDetection, PlainKeys) {
  EXPECT_EQ(DetectArrayParsingStrategy("tags=a&tags=b").type(), ArrayParsingStrategy::Type::AccumulateValues);
  EXPECT_EQ(DetectArrayParsingStrategy("").type(), ArrayParsingStrategy::Type::AccumulateValues);
}

TEST(StrategyDetection, BracketsInValuesIgnored) {
  EXPECT_EQ(DetectArrayParsingStrategy("q=tags[0]").type(), ArrayParsingStrategy::Type::AccumulateValues);
}

}  // namespace urlform
