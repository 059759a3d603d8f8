#include "urlform/form-config.hpp"

#include <string_view>
#include <utility>

#include "urlform/data-strategy.hpp"
#include "urlform/date-strategy.hpp"
#include "urlform/strategy-detection.hpp"

namespace urlform {

void FormEncoderConfig::validate() const {
  arrayStrategy.validate();
  dateStrategy.validate();
  dataStrategy.validate();
}

FormDecoderConfig FormDecoderConfig::WithAutoDetectedStrategy(std::string_view body,
                                                              DateDecodingStrategy dateStrategy,
                                                              DataDecodingStrategy dataStrategy) {
  FormDecoderConfig config;
  config.withArrayStrategy(DetectArrayParsingStrategy(body))
      .withDateStrategy(std::move(dateStrategy))
      .withDataStrategy(std::move(dataStrategy));
  return config;
}

void FormDecoderConfig::validate() const {
  arrayStrategy.validate();
  dateStrategy.validate();
  dataStrategy.validate();
}

}  // namespace urlform
