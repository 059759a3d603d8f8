#pragma once

#include <string>
#include <string_view>

namespace urlform::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' to 'plusAs'.
// Returns a pointer to the new logical end of the decoded sequence.
// Malformed escapes (truncated '%' or non-hex digits):
//  - strictInvalid == true: returns nullptr, leaving the buffer in an unspecified partially modified state.
//  - strictInvalid == false: the '%' is kept literally and decoding resumes on the char right after it,
//    so "%G%41" decodes to "%GA" and a trailing "%4" is kept as is.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Decodes one key or value token of an application/x-www-form-urlencoded body ('+' is a space).
// Never fails: malformed escapes are passed through literally (see DecodeInPlace).
std::string FormDecode(std::string_view token);

// Tells whether 'token' contains a '%' that does not start a valid escape sequence.
bool HasMalformedEscape(std::string_view token) noexcept;

}  // namespace urlform::url
