// urlform Umbrella Header
//
// Include this single header to pull in the public codec API:
//   - FormEncoder / FormDecoder and the Encode / Decode helpers
//   - Configuration types and array, date and data strategies
//   - FormCodable customization point and the encoding / decoding containers
//   - FormContainer tree, pair level helpers and strategy detection
//   - Error types
//
// Each re-exported header line is annotated with 'IWYU pragma: export' so that users only including
// <urlform/urlform.hpp> satisfy include-cleaner.
//
// Usage Example:
//    #include <urlform/urlform.hpp>
//    using namespace urlform;
//    struct User { std::string name; int age; };
//    template <> struct FormCodable<User> { ... };
//    std::string body = Encode(User{"John Doe", 30});   // "name=John+Doe&age=30"
//    User user = Decode<User>(body);
#pragma once

#include "urlform/array-strategy.hpp"      // IWYU pragma: export
#include "urlform/blob.hpp"                // IWYU pragma: export
#include "urlform/data-strategy.hpp"       // IWYU pragma: export
#include "urlform/date-strategy.hpp"       // IWYU pragma: export
#include "urlform/decimal.hpp"             // IWYU pragma: export
#include "urlform/form-codable.hpp"        // IWYU pragma: export
#include "urlform/form-config.hpp"         // IWYU pragma: export
#include "urlform/form-container.hpp"      // IWYU pragma: export
#include "urlform/form-decoder.hpp"        // IWYU pragma: export
#include "urlform/form-encoder.hpp"        // IWYU pragma: export
#include "urlform/form-error.hpp"          // IWYU pragma: export
#include "urlform/form-pairs.hpp"          // IWYU pragma: export
#include "urlform/strategy-detection.hpp"  // IWYU pragma: export
#include "urlform/timedef.hpp"             // IWYU pragma: export
