#include "codec/borsh.hpp"

#include <algorithm>

namespace x1memo::codec {

namespace {

template <typename T>
void WriteLittleEndian(std::vector<std::uint8_t>* out, T value) {
  auto bits = static_cast<std::uint64_t>(value);
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out->push_back(static_cast<std::uint8_t>(bits & 0xFF));
    bits >>= 8;
  }
}

std::uint64_t LoadLittleEndian(std::span<const std::uint8_t> bytes) {
  std::uint64_t value = 0;
  for (std::size_t i = bytes.size(); i > 0; --i) {
    value = (value << 8) | bytes[i - 1];
  }
  return value;
}

}  // namespace

void WriteU8(std::vector<std::uint8_t>* out, std::uint8_t value) { out->push_back(value); }

void WriteU32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  WriteLittleEndian(out, value);
}

void WriteU64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  WriteLittleEndian(out, value);
}

void WriteI64(std::vector<std::uint8_t>* out, std::int64_t value) {
  WriteLittleEndian(out, static_cast<std::uint64_t>(value));
}

void WriteBool(std::vector<std::uint8_t>* out, bool value) { out->push_back(value ? 1 : 0); }

void WriteFixed(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes) {
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void WritePubkey(std::vector<std::uint8_t>* out, const chain::Pubkey& key) {
  WriteFixed(out, key.bytes);
}

void WriteString(std::vector<std::uint8_t>* out, std::string_view value) {
  WriteU32(out, static_cast<std::uint32_t>(value.size()));
  out->insert(out->end(), value.begin(), value.end());
}

void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> value) {
  WriteU32(out, static_cast<std::uint32_t>(value.size()));
  WriteFixed(out, value);
}

void WriteStringVector(std::vector<std::uint8_t>* out, const std::vector<std::string>& values) {
  WriteU32(out, static_cast<std::uint32_t>(values.size()));
  for (const auto& value : values) {
    WriteString(out, value);
  }
}

void WriteOptionString(std::vector<std::uint8_t>* out, const std::optional<std::string>& value) {
  WriteBool(out, value.has_value());
  if (value) {
    WriteString(out, *value);
  }
}

void WriteOptionStringVector(std::vector<std::uint8_t>* out,
                             const std::optional<std::vector<std::string>>& value) {
  WriteBool(out, value.has_value());
  if (value) {
    WriteStringVector(out, *value);
  }
}

void WriteOptionOptionString(std::vector<std::uint8_t>* out,
                             const std::optional<std::optional<std::string>>& value) {
  WriteBool(out, value.has_value());
  if (value) {
    WriteOptionString(out, *value);
  }
}

bool BorshReader::Fail(ReadFailure failure, std::string message) {
  if (failure_ == ReadFailure::kNone) {
    failure_ = failure;
    error_ = std::move(message);
  }
  return false;
}

bool BorshReader::Need(std::size_t count, std::string_view field) {
  if (failure_ != ReadFailure::kNone) {
    return false;
  }
  if (remaining() < count) {
    return Fail(ReadFailure::kTruncated,
                "truncated: " + std::string(field) + " needs " + std::to_string(count) +
                    " bytes at offset " + std::to_string(offset_) + ", " +
                    std::to_string(remaining()) + " available");
  }
  return true;
}

bool BorshReader::ReadU8(std::uint8_t* value, std::string_view field) {
  if (!Need(1, field)) return false;
  *value = data_[offset_++];
  return true;
}

bool BorshReader::ReadU32(std::uint32_t* value, std::string_view field) {
  if (!Need(4, field)) return false;
  *value = static_cast<std::uint32_t>(LoadLittleEndian(data_.subspan(offset_, 4)));
  offset_ += 4;
  return true;
}

bool BorshReader::ReadU64(std::uint64_t* value, std::string_view field) {
  if (!Need(8, field)) return false;
  *value = LoadLittleEndian(data_.subspan(offset_, 8));
  offset_ += 8;
  return true;
}

bool BorshReader::ReadI64(std::int64_t* value, std::string_view field) {
  std::uint64_t raw = 0;
  if (!ReadU64(&raw, field)) return false;
  *value = static_cast<std::int64_t>(raw);
  return true;
}

bool BorshReader::ReadBool(bool* value, std::string_view field) {
  std::uint8_t raw = 0;
  if (!ReadU8(&raw, field)) return false;
  if (raw > 1) {
    return Fail(ReadFailure::kMalformed,
                "malformed: " + std::string(field) + " has bool byte " + std::to_string(raw));
  }
  *value = raw == 1;
  return true;
}

bool BorshReader::ReadFixed(std::span<std::uint8_t> out, std::string_view field) {
  if (!Need(out.size(), field)) return false;
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), out.size(), out.begin());
  offset_ += out.size();
  return true;
}

bool BorshReader::ReadPubkey(chain::Pubkey* key, std::string_view field) {
  return ReadFixed(key->bytes, field);
}

bool BorshReader::ReadString(std::string* value, std::string_view field) {
  std::uint32_t length = 0;
  if (!ReadU32(&length, field)) return false;
  if (!Need(length, field)) return false;
  std::string text(reinterpret_cast<const char*>(data_.data() + offset_), length);
  if (!IsValidUtf8(text)) {
    return Fail(ReadFailure::kMalformed, "malformed: " + std::string(field) + " is not UTF-8");
  }
  offset_ += length;
  *value = std::move(text);
  return true;
}

bool BorshReader::ReadBytes(std::vector<std::uint8_t>* value, std::string_view field) {
  std::uint32_t length = 0;
  if (!ReadU32(&length, field)) return false;
  if (!Need(length, field)) return false;
  const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset_);
  value->assign(begin, begin + length);
  offset_ += length;
  return true;
}

bool BorshReader::ReadStringVector(std::vector<std::string>* values, std::string_view field) {
  std::uint32_t count = 0;
  if (!ReadU32(&count, field)) return false;
  // Each element carries at least its 4-byte length.
  if (static_cast<std::uint64_t>(count) * 4 > remaining()) {
    return Need(static_cast<std::size_t>(count) * 4, field);
  }
  std::vector<std::string> parsed;
  parsed.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    std::string item;
    if (!ReadString(&item, field)) return false;
    parsed.push_back(std::move(item));
  }
  *values = std::move(parsed);
  return true;
}

bool BorshReader::ReadOptionTag(bool* present, std::string_view field) {
  std::uint8_t tag = 0;
  if (!ReadU8(&tag, field)) return false;
  if (tag > 1) {
    return Fail(ReadFailure::kMalformed,
                "malformed: " + std::string(field) + " has option tag " + std::to_string(tag));
  }
  *present = tag == 1;
  return true;
}

bool BorshReader::ReadOptionString(std::optional<std::string>* value, std::string_view field) {
  bool present = false;
  if (!ReadOptionTag(&present, field)) return false;
  if (!present) {
    value->reset();
    return true;
  }
  std::string text;
  if (!ReadString(&text, field)) return false;
  *value = std::move(text);
  return true;
}

bool BorshReader::ReadOptionStringVector(std::optional<std::vector<std::string>>* value,
                                         std::string_view field) {
  bool present = false;
  if (!ReadOptionTag(&present, field)) return false;
  if (!present) {
    value->reset();
    return true;
  }
  std::vector<std::string> items;
  if (!ReadStringVector(&items, field)) return false;
  *value = std::move(items);
  return true;
}

bool BorshReader::ReadOptionOptionString(std::optional<std::optional<std::string>>* value,
                                         std::string_view field) {
  bool present = false;
  if (!ReadOptionTag(&present, field)) return false;
  if (!present) {
    value->reset();
    return true;
  }
  std::optional<std::string> inner;
  if (!ReadOptionString(&inner, field)) return false;
  *value = std::move(inner);
  return true;
}

bool BorshReader::Skip(std::size_t count, std::string_view field) {
  if (!Need(count, field)) return false;
  offset_ += count;
  return true;
}

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    std::uint32_t code = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      extra = 1;
      code = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      extra = 2;
      code = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      extra = 3;
      code = lead & 0x07;
    } else {
      return false;
    }
    if (i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) return false;
      code = (code << 6) | (cont & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((extra == 1 && code < 0x80) || (extra == 2 && code < 0x800) ||
        (extra == 3 && (code < 0x10000 || code > 0x10FFFF)) ||
        (code >= 0xD800 && code <= 0xDFFF)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

}  // namespace x1memo::codec
