#include "urlform/form-encoder.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "urlform/blob.hpp"
#include "urlform/form-config.hpp"
#include "urlform/form-container.hpp"
#include "urlform/form-error.hpp"
#include "urlform/stringconv.hpp"

namespace urlform {

FormEncoder::FormEncoder(FormEncoderConfig config) : _config(std::move(config)) { _config.validate(); }

FormContainer FormEncoder::boxBlob(const Blob& blob) {
  if (!_config.dataStrategy.isDeferred()) {
    return FormContainer::scalar(_config.dataStrategy.encode(blob));
  }
  FormContainer::Sequence bytes;
  bytes.reserve(blob.size());
  for (std::byte byte : blob) {
    bytes.push_back(FormContainer::scalar(IntegralToString(static_cast<unsigned>(byte))));
  }
  return FormContainer::sequence(std::move(bytes));
}

FormContainer FormEncoder::takeRoot() {
  if (!_root) {
    throw EncodingError(EncodingError::Reason::NoContainer, "No container found");
  }
  FormContainer root = std::move(*_root);
  _root.reset();
  return root;
}

void KeyedEncodingContainer::encodeNil(std::string_view key) { _mapping.set(key, FormContainer::scalar({})); }

void KeyedEncodingContainer::superEncoder() const {
  throw EncodingError(EncodingError::Reason::Unsupported, "superEncoder is not supported by form encoding",
                      _encoder._codingPath);
}

const CodingPath& KeyedEncodingContainer::codingPath() const noexcept { return _encoder._codingPath; }

void SequenceEncodingContainer::encodeNil() { _sequence.append(FormContainer::scalar({})); }

void SequenceEncodingContainer::superEncoder() const {
  throw EncodingError(EncodingError::Reason::Unsupported, "superEncoder is not supported by form encoding",
                      _encoder._codingPath);
}

const CodingPath& SequenceEncodingContainer::codingPath() const noexcept { return _encoder._codingPath; }

}  // namespace urlform
