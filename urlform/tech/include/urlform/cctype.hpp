#pragma once

namespace urlform {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool isalpha(char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool isspace(char ch) { return ch == ' ' || (ch >= '\t' && ch <= '\r'); }

constexpr char tolower(char ch) { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

}  // namespace urlform
