#include "urlform/strategy-detection.hpp"

#include <string_view>

#include "urlform/array-strategy.hpp"
#include "urlform/form-pairs.hpp"
#include "urlform/log.hpp"
#include "urlform/simple-charconv.hpp"

namespace urlform {

namespace {

bool HasIndexedSegment(std::string_view key) {
  for (auto openPos = key.find('['); openPos != std::string_view::npos; openPos = key.find('[', openPos + 1)) {
    const auto closePos = key.find(']', openPos + 1);
    if (closePos == std::string_view::npos) {
      break;
    }
    const auto len = closePos - openPos - 1;
    if (len != 0 && AllDigits(key.data() + openPos + 1, len)) {
      return true;
    }
  }
  return false;
}

}  // namespace

ArrayParsingStrategy DetectArrayParsingStrategy(std::string_view body) {
  bool hasBracket = false;
  // keys are percent decoded first, brackets may be sent as %5B and %5D
  for (const FormPair& pair : SplitFormPairs(body, ArrayStyle::AccumulateValues)) {
    const std::string_view key = pair.path.front();
    if (HasIndexedSegment(key)) {
      log::debug("Detected bracketsWithIndices array strategy from key '{}'", key);
      return ArrayParsingStrategy::bracketsWithIndices();
    }
    hasBracket = hasBracket || key.find('[') != std::string_view::npos;
  }
  if (hasBracket) {
    log::debug("Detected brackets array strategy");
    return ArrayParsingStrategy::brackets();
  }
  log::debug("Detected accumulateValues array strategy");
  return ArrayParsingStrategy::accumulateValues();
}

}  // namespace urlform
