#pragma once

#include <string_view>
#include <utility>

#include "urlform/array-strategy.hpp"
#include "urlform/data-strategy.hpp"
#include "urlform/date-strategy.hpp"

namespace urlform {

struct FormEncoderConfig {
  // Throws std::invalid_argument if one of the strategies is not usable.
  void validate() const;

  FormEncoderConfig& withArrayStrategy(ArrayEncodingStrategy strategy) {
    arrayStrategy = std::move(strategy);
    return *this;
  }

  FormEncoderConfig& withDateStrategy(DateEncodingStrategy strategy) {
    dateStrategy = std::move(strategy);
    return *this;
  }

  FormEncoderConfig& withDataStrategy(DataEncodingStrategy strategy) {
    dataStrategy = std::move(strategy);
    return *this;
  }

  // Convention for sequences and nested mappings in keys.
  ArrayEncodingStrategy arrayStrategy{ArrayEncodingStrategy::accumulateValues()};

  // Text form of SysTimePoint values.
  DateEncodingStrategy dateStrategy{DateEncodingStrategy::deferred()};

  // Text form of Blob values.
  DataEncodingStrategy dataStrategy{DataEncodingStrategy::deferred()};
};

struct FormDecoderConfig {
  // Builds a configuration whose array strategy is detected from 'body' (see DetectArrayParsingStrategy).
  static FormDecoderConfig WithAutoDetectedStrategy(std::string_view body, DateDecodingStrategy dateStrategy = {},
                                                    DataDecodingStrategy dataStrategy = {});

  void validate() const;

  FormDecoderConfig& withArrayStrategy(ArrayParsingStrategy strategy) {
    arrayStrategy = std::move(strategy);
    return *this;
  }

  FormDecoderConfig& withDateStrategy(DateDecodingStrategy strategy) {
    dateStrategy = std::move(strategy);
    return *this;
  }

  FormDecoderConfig& withDataStrategy(DataDecodingStrategy strategy) {
    dataStrategy = std::move(strategy);
    return *this;
  }

  ArrayParsingStrategy arrayStrategy{ArrayParsingStrategy::accumulateValues()};

  DateDecodingStrategy dateStrategy{DateDecodingStrategy::deferred()};

  DataDecodingStrategy dataStrategy{DataDecodingStrategy::deferred()};
};

}  // namespace urlform
