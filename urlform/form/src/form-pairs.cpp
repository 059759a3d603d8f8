#include "urlform/form-pairs.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "urlform/form-container.hpp"
#include "urlform/form-error.hpp"
#include "urlform/log.hpp"
#include "urlform/simple-charconv.hpp"
#include "urlform/stringconv.hpp"
#include "urlform/url-decode.hpp"
#include "urlform/url-encode.hpp"

namespace urlform {

namespace {

// Longer digit runs are kept as plain keys, so that the index always fits in an int64_t.
constexpr std::size_t kMaxIndexDigits = 18;

// Bracket segments past this depth are kept, brackets included, as a single literal key of the deepest node.
constexpr std::size_t kMaxNestingDepth = 64;

bool IsIndexSegment(std::string_view segment) {
  return !segment.empty() && segment.size() <= kMaxIndexDigits && AllDigits(segment.data(), segment.size());
}

// Intermediate tree of the bracket parsers. Unlike FormContainer, sequences are sparse (keyed by index) until
// the whole body has been read.
class ParseNode {
 public:
  enum class Kind : std::uint8_t { Unset, Leaf, List, Object };

  ParseNode& field(std::string_view name) {
    if (_kind != Kind::Object) {
      reset(Kind::Object);
    }
    const auto [it, inserted] = _fieldPositions.try_emplace(std::string(name), _fields.size());
    if (inserted) {
      return _fields.emplace_back(it->first, ParseNode{}).second;
    }
    return _fields[it->second].second;
  }

  ParseNode& unkeyedSlot() {
    if (_kind != Kind::List) {
      reset(Kind::List);
    }
    if (_hasIndexed && !_hasUnkeyed) {
      log::debug("Mixing '[]' and '[N]' in the same sequence, unkeyed element placed after index {}", _maxSlot);
    }
    _hasUnkeyed = true;
    const int64_t slot = _maxSlot + 1;
    _maxSlot = slot;
    _slotPositions.emplace(slot, _slots.size());
    return _slots.emplace_back(slot, ParseNode{}).second;
  }

  ParseNode& indexedSlot(int64_t slot) {
    if (_kind != Kind::List) {
      reset(Kind::List);
    }
    if (_hasUnkeyed && !_hasIndexed) {
      log::debug("Mixing '[]' and '[N]' in the same sequence, index {} received after unkeyed elements", slot);
    }
    _hasIndexed = true;
    _maxSlot = std::max(_maxSlot, slot);
    const auto [it, inserted] = _slotPositions.try_emplace(slot, _slots.size());
    if (inserted) {
      return _slots.emplace_back(slot, ParseNode{}).second;
    }
    return _slots[it->second].second;
  }

  void setLeaf(std::string value) {
    reset(Kind::Leaf);
    _value = std::move(value);
  }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  FormContainer materialize() && {
    switch (_kind) {
      case Kind::List: {
        std::ranges::sort(_slots, {}, &std::pair<int64_t, ParseNode>::first);
        FormContainer::Sequence elements;
        elements.reserve(_slots.size());
        for (auto& [slot, node] : _slots) {
          elements.push_back(std::move(node).materialize());
        }
        return FormContainer::sequence(std::move(elements));
      }
      case Kind::Object: {
        FormContainer::Mapping entries;
        entries.reserve(_fields.size());
        for (auto& [name, node] : _fields) {
          entries.emplace_back(std::move(name), std::move(node).materialize());
        }
        return FormContainer::mapping(std::move(entries));
      }
      default:
        return FormContainer::scalar(std::move(_value));
    }
  }

 private:
  void reset(Kind kind) {
    if (_kind != Kind::Unset && _kind != kind) {
      log::debug("Form node rewritten from kind {} to kind {}", static_cast<int>(_kind), static_cast<int>(kind));
    }
    _kind = kind;
    _value.clear();
    _slots.clear();
    _slotPositions.clear();
    _fields.clear();
    _fieldPositions.clear();
    _maxSlot = -1;
    _hasUnkeyed = false;
    _hasIndexed = false;
  }

  Kind _kind{Kind::Unset};
  bool _hasUnkeyed{false};
  bool _hasIndexed{false};
  int64_t _maxSlot{-1};
  std::string _value;
  std::vector<std::pair<int64_t, ParseNode>> _slots;
  std::unordered_map<int64_t, std::size_t> _slotPositions;
  std::vector<std::pair<std::string, ParseNode>> _fields;
  std::unordered_map<std::string, std::size_t> _fieldPositions;
};

std::string LiteralKey(std::span<const std::string> segments) {
  std::string key(segments.front());
  for (const std::string& segment : segments.subspan(1)) {
    key.push_back('[');
    key.append(segment);
    key.push_back(']');
  }
  return key;
}

ParseNode& Descend(ParseNode& node, const std::string& segment) {
  if (segment.empty()) {
    return node.unkeyedSlot();
  }
  if (IsIndexSegment(segment) && node.kind() != ParseNode::Kind::Object) {
    return node.indexedSlot(StringToIntegral<int64_t>(segment));
  }
  return node.field(segment);
}

void InsertBracketPath(ParseNode& root, std::span<const std::string> path, std::string value) {
  // the first segment is always a field name of the root, even if numeric
  ParseNode* node = &root.field(path.front());
  std::span<const std::string> segments = path.subspan(1);
  std::string literal;
  if (segments.size() > kMaxNestingDepth) {
    log::debug("Form key of depth {} exceeds the maximum of {}, keeping its last segments literally",
               segments.size(), kMaxNestingDepth);
    literal = LiteralKey(segments.subspan(kMaxNestingDepth - 1));
    segments = segments.first(kMaxNestingDepth - 1);
  }
  for (const std::string& segment : segments) {
    node = &Descend(*node, segment);
  }
  if (!literal.empty()) {
    node = &node->field(literal);
  }
  node->setLeaf(std::move(value));
}

FormContainer BuildAccumulated(std::span<const FormPair> pairs) {
  FormContainer root = FormContainer::mapping();
  for (const FormPair& pair : pairs) {
    std::string key = pair.path.size() == 1U ? pair.path.front() : pair.key();
    FormContainer* existing = root.find(key);
    if (existing == nullptr) {
      root.set(key, FormContainer::scalar(pair.value));
    } else if (existing->isSequence()) {
      existing->append(FormContainer::scalar(pair.value));
    } else {
      FormContainer::Sequence elements;
      elements.push_back(std::move(*existing));
      elements.push_back(FormContainer::scalar(pair.value));
      *existing = FormContainer::sequence(std::move(elements));
    }
  }
  return root;
}

[[noreturn]] void ThrowUnrepresentable(std::span<const std::string> path, std::size_t index,
                                       FormContainer::Kind kind) {
  CodingPath codingPath(path.begin(), path.end());
  codingPath.push_back(IntegralToString(index));
  std::string message("Cannot represent a ");
  message.append(KindName(kind));
  message.append(" inside a sequence with the accumulateValues array strategy");
  throw EncodingError(EncodingError::Reason::UnrepresentableValue, std::move(message), std::move(codingPath));
}

void FlattenInto(const FormContainer& node, ArrayStyle style, std::vector<std::string>& path,
                 std::vector<FormPair>& out) {
  switch (node.kind()) {
    case FormContainer::Kind::Scalar:
      out.push_back(FormPair{path, node.scalarValue()});
      break;
    case FormContainer::Kind::Mapping:
      for (const auto& [key, value] : node.entries()) {
        path.push_back(key);
        FlattenInto(value, style, path, out);
        path.pop_back();
      }
      break;
    case FormContainer::Kind::Sequence: {
      std::size_t index = 0;
      for (const FormContainer& elem : node.elements()) {
        switch (style) {
          case ArrayStyle::AccumulateValues:
            if (!elem.isScalar()) {
              ThrowUnrepresentable(path, index, elem.kind());
            }
            out.push_back(FormPair{path, elem.scalarValue()});
            break;
          case ArrayStyle::Brackets:
            path.emplace_back();
            FlattenInto(elem, style, path, out);
            path.pop_back();
            break;
          case ArrayStyle::BracketsWithIndices:
            path.push_back(IntegralToString(index));
            FlattenInto(elem, style, path, out);
            path.pop_back();
            break;
        }
        ++index;
      }
      break;
    }
  }
}

}  // namespace

std::string_view ArrayStyleName(ArrayStyle style) noexcept {
  switch (style) {
    case ArrayStyle::AccumulateValues:
      return "accumulateValues";
    case ArrayStyle::Brackets:
      return "brackets";
    case ArrayStyle::BracketsWithIndices:
      return "bracketsWithIndices";
    default:
      return "unknown";
  }
}

std::string FormPair::key() const {
  std::string ret;
  for (std::size_t pos = 0; pos < path.size(); ++pos) {
    if (pos == 0) {
      ret.append(path[pos]);
    } else {
      ret.push_back('[');
      ret.append(path[pos]);
      ret.push_back(']');
    }
  }
  return ret;
}

std::vector<std::string> SplitKeySegments(std::string_view key) {
  std::vector<std::string> segments;
  auto openPos = key.find('[');
  segments.emplace_back(key.substr(0, openPos));
  while (openPos != std::string_view::npos) {
    const auto closePos = key.find(']', openPos + 1);
    if (closePos == std::string_view::npos) {
      segments.emplace_back(key.substr(openPos + 1));
      break;
    }
    segments.emplace_back(key.substr(openPos + 1, closePos - openPos - 1));
    openPos = key.find('[', closePos + 1);
  }
  return segments;
}

std::vector<FormPair> SplitFormPairs(std::string_view body, ArrayStyle style) {
  std::vector<FormPair> pairs;
  std::string_view::size_type pos = 0;
  while (pos <= body.size()) {
    auto ampPos = body.find('&', pos);
    if (ampPos == std::string_view::npos) {
      ampPos = body.size();
    }
    const std::string_view field = body.substr(pos, ampPos - pos);
    pos = ampPos + 1;
    if (field.empty()) {
      continue;
    }
    const auto eqPos = field.find('=');
    std::string key = url::FormDecode(field.substr(0, eqPos));

    FormPair& pair = pairs.emplace_back();
    if (style == ArrayStyle::AccumulateValues) {
      pair.path.push_back(std::move(key));
    } else {
      pair.path = SplitKeySegments(key);
    }
    if (eqPos != std::string_view::npos) {
      pair.value = url::FormDecode(field.substr(eqPos + 1));
    }
  }
  return pairs;
}

std::string JoinFormPairs(std::span<const FormPair> pairs) {
  std::string body;
  bool first = true;
  for (const FormPair& pair : pairs) {
    if (!first) {
      body.push_back('&');
    }
    first = false;
    if (pair.path.empty()) {
      url::AppendFormEncoded(body, pair.value);
      continue;
    }
    url::AppendFormEncoded(body, pair.path.front());
    for (std::size_t pos = 1; pos < pair.path.size(); ++pos) {
      body.push_back('[');
      url::AppendFormEncoded(body, pair.path[pos]);
      body.push_back(']');
    }
    body.push_back('=');
    url::AppendFormEncoded(body, pair.value);
  }
  return body;
}

std::vector<FormPair> FlattenFormContainer(const FormContainer& root, ArrayStyle style) {
  std::vector<FormPair> pairs;
  std::vector<std::string> path;
  if (root.isSequence()) {
    // bare values at the root, nested containers are keyed by their index
    std::size_t index = 0;
    for (const FormContainer& elem : root.elements()) {
      if (elem.isScalar()) {
        pairs.push_back(FormPair{{}, elem.scalarValue()});
      } else if (style == ArrayStyle::AccumulateValues) {
        ThrowUnrepresentable(path, index, elem.kind());
      } else {
        path.push_back(IntegralToString(index));
        FlattenInto(elem, style, path, pairs);
        path.pop_back();
      }
      ++index;
    }
  } else {
    FlattenInto(root, style, path, pairs);
  }
  return pairs;
}

FormContainer BuildFormContainer(std::span<const FormPair> pairs, ArrayStyle style) {
  if (style == ArrayStyle::AccumulateValues) {
    return BuildAccumulated(pairs);
  }
  ParseNode root;
  for (const FormPair& pair : pairs) {
    if (!pair.path.empty()) {
      InsertBracketPath(root, pair.path, pair.value);
    }
  }
  if (root.kind() == ParseNode::Kind::Unset) {
    return FormContainer::mapping();
  }
  return std::move(root).materialize();
}

}  // namespace urlform
