#pragma once

#include <string_view>

#include "urlform/array-strategy.hpp"

namespace urlform {

// Guesses the array parsing strategy a body was encoded with, by looking at its keys only:
//  - an indexed bracket 'tags[0]' selects bracketsWithIndices
//  - otherwise any bracket ('tags[]', 'user[name]') selects brackets
//  - otherwise accumulateValues
ArrayParsingStrategy DetectArrayParsingStrategy(std::string_view body);

}  // namespace urlform
