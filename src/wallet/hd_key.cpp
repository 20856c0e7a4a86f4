#include "msig/wallet/hd_key.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include "msig/common/errors.hpp"
#include "msig/common/secure_zeroize.hpp"
#include "msig/crypto/base58.hpp"
#include "msig/crypto/hash.hpp"

namespace msig {
namespace {

constexpr char kMasterKeyHmacKey[] = "Bitcoin seed";
constexpr size_t kSerializedKeySize = 78;

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t ReadU32Be(std::span<const uint8_t> input, size_t offset) {
  return (static_cast<uint32_t>(input[offset]) << 24) |
         (static_cast<uint32_t>(input[offset + 1]) << 16) |
         (static_cast<uint32_t>(input[offset + 2]) << 8) |
         static_cast<uint32_t>(input[offset + 3]);
}

bool ParseSegment(std::string_view text, PathSegment* out) {
  if (text.empty()) {
    return false;
  }
  bool hardened = false;
  const char last = text.back();
  if (last == '\'' || last == 'h' || last == 'H') {
    hardened = true;
    text.remove_suffix(1);
  }
  if (text.empty() || text.size() > 10) {
    return false;
  }

  uint64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  if (value >= kHardenedOffset) {
    return false;
  }

  out->index = static_cast<uint32_t>(value);
  out->hardened = hardened;
  return true;
}

}  // namespace

uint32_t PathSegment::ChildNumber() const {
  return hardened ? (index | kHardenedOffset) : index;
}

bool PathSegment::operator==(const PathSegment& other) const {
  return index == other.index && hardened == other.hardened;
}

DerivationPath::DerivationPath(std::vector<PathSegment> segments) : segments_(std::move(segments)) {
  for (const PathSegment& segment : segments_) {
    if (segment.index >= kHardenedOffset) {
      throw ConfigurationError(ErrorCode::kInvalidDerivationPath, "Path index must be below 2^31");
    }
  }
}

bool DerivationPath::TryParse(std::string_view text, DerivationPath* out) {
  if (text.empty() || text.front() != 'm') {
    return false;
  }
  text.remove_prefix(1);

  std::vector<PathSegment> segments;
  while (!text.empty()) {
    if (text.front() != '/') {
      return false;
    }
    text.remove_prefix(1);
    const size_t next = text.find('/');
    const std::string_view token = text.substr(0, next);
    PathSegment segment;
    if (!ParseSegment(token, &segment)) {
      return false;
    }
    segments.push_back(segment);
    text = next == std::string_view::npos ? std::string_view() : text.substr(next);
  }

  *out = DerivationPath(std::move(segments));
  return true;
}

DerivationPath DerivationPath::Parse(std::string_view text) {
  DerivationPath out;
  if (!TryParse(text, &out)) {
    throw ConfigurationError(ErrorCode::kInvalidDerivationPath,
                             "Malformed derivation path: " + std::string(text));
  }
  return out;
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
  std::vector<PathSegment> segments = segments_;
  segments.push_back(PathSegment{index, hardened});
  return DerivationPath(std::move(segments));
}

bool DerivationPath::AllHardened() const {
  return std::all_of(segments_.begin(), segments_.end(),
                     [](const PathSegment& segment) { return segment.hardened; });
}

const std::vector<PathSegment>& DerivationPath::segments() const {
  return segments_;
}

size_t DerivationPath::size() const {
  return segments_.size();
}

bool DerivationPath::empty() const {
  return segments_.empty();
}

std::string DerivationPath::ToString() const {
  std::string out = "m";
  for (const PathSegment& segment : segments_) {
    out.push_back('/');
    out.append(std::to_string(segment.index));
    if (segment.hardened) {
      out.push_back('\'');
    }
  }
  return out;
}

bool DerivationPath::operator==(const DerivationPath& other) const {
  return segments_ == other.segments_;
}

bool DerivationPath::operator!=(const DerivationPath& other) const {
  return !(*this == other);
}

ExtendedKey::~ExtendedKey() {
  SecureZeroize(&private_scalar_);
  SecureZeroize(&chain_code_);
}

ExtendedKey ExtendedKey::FromSeed(std::span<const uint8_t> seed) {
  if (seed.size() < 16 || seed.size() > 64) {
    throw std::invalid_argument("BIP32 seed must be 16 to 64 bytes");
  }

  const std::string_view hmac_key(kMasterKeyHmacKey);
  Bytes i = HmacSha512(
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(hmac_key.data()), hmac_key.size()), seed);

  ExtendedKey out;
  try {
    out.private_scalar_ = Scalar::FromCanonicalBytes(std::span<const uint8_t>(i.data(), 32));
  } catch (const std::invalid_argument&) {
    SecureZeroize(&i);
    throw std::runtime_error("Seed produced an invalid master key");
  }
  if (out.private_scalar_->IsZero()) {
    SecureZeroize(&i);
    throw std::runtime_error("Seed produced an invalid master key");
  }

  std::copy(i.begin() + 32, i.end(), out.chain_code_.begin());
  out.public_point_ = ECPoint::GeneratorMultiply(*out.private_scalar_);
  SecureZeroize(&i);
  return out;
}

ExtendedKey ExtendedKey::FromBase58(std::string_view encoded, const NetworkParams& params) {
  Bytes payload;
  if (!DecodeBase58Check(encoded, &payload) || payload.size() != kSerializedKeySize) {
    throw std::invalid_argument("Extended key is not valid Base58Check of 78 bytes");
  }

  const uint32_t version = ReadU32Be(payload, 0);
  const bool is_private = version == params.xprv_version;
  if (!is_private && version != params.xpub_version) {
    SecureZeroize(&payload);
    throw std::invalid_argument("Extended key version does not match network " + params.name);
  }

  ExtendedKey out;
  out.depth_ = payload[4];
  out.parent_fingerprint_ = ReadU32Be(payload, 5);
  out.child_number_ = ReadU32Be(payload, 9);
  std::copy(payload.begin() + 13, payload.begin() + 45, out.chain_code_.begin());
  if (out.depth_ == 0 && (out.parent_fingerprint_ != 0 || out.child_number_ != 0)) {
    SecureZeroize(&payload);
    throw std::invalid_argument("Master extended key has a parent fingerprint or child number");
  }

  const std::span<const uint8_t> key(payload.data() + 45, 33);
  if (is_private) {
    if (key[0] != 0x00) {
      SecureZeroize(&payload);
      throw std::invalid_argument("Private extended key must carry a 0x00 prefix");
    }
    try {
      out.private_scalar_ = Scalar::FromCanonicalBytes(key.subspan(1));
    } catch (const std::invalid_argument&) {
      SecureZeroize(&payload);
      throw;
    }
    if (out.private_scalar_->IsZero()) {
      SecureZeroize(&payload);
      throw std::invalid_argument("Private extended key is zero");
    }
    out.public_point_ = ECPoint::GeneratorMultiply(*out.private_scalar_);
  } else {
    out.public_point_ = ECPoint::FromCompressed(key);
  }

  SecureZeroize(&payload);
  return out;
}

ExtendedKey ExtendedKey::DeriveChild(uint32_t child_number) const {
  const bool hardened = (child_number & kHardenedOffset) != 0;
  if (hardened && !has_private_key()) {
    throw std::invalid_argument("Cannot derive a hardened child from a public key");
  }
  if (depth_ == 0xFF) {
    throw std::invalid_argument("Maximum BIP32 depth reached");
  }

  Bytes data;
  data.reserve(37);
  if (hardened) {
    std::array<uint8_t, 32> secret = private_scalar_->ToCanonicalBytes();
    data.push_back(0x00);
    data.insert(data.end(), secret.begin(), secret.end());
    SecureZeroize(&secret);
  } else {
    const std::array<uint8_t, 33>& compressed = public_point_.compressed();
    data.insert(data.end(), compressed.begin(), compressed.end());
  }
  AppendU32Be(child_number, &data);

  Bytes i = HmacSha512(chain_code_, data);
  SecureZeroize(&data);

  Scalar il;
  try {
    il = Scalar::FromCanonicalBytes(std::span<const uint8_t>(i.data(), 32));
  } catch (const std::invalid_argument&) {
    SecureZeroize(&i);
    throw std::runtime_error("BIP32 child derivation produced IL >= n");
  }

  ExtendedKey child;
  child.depth_ = static_cast<uint8_t>(depth_ + 1);
  child.parent_fingerprint_ = Fingerprint();
  child.child_number_ = child_number;
  std::copy(i.begin() + 32, i.end(), child.chain_code_.begin());
  SecureZeroize(&i);

  if (has_private_key()) {
    Scalar child_scalar = il + *private_scalar_;
    SecureZeroize(&il);
    if (child_scalar.IsZero()) {
      throw std::runtime_error("BIP32 child derivation produced a zero key");
    }
    child.public_point_ = ECPoint::GeneratorMultiply(child_scalar);
    child.private_scalar_ = child_scalar;
    SecureZeroize(&child_scalar);
  } else {
    if (il.IsZero()) {
      throw std::runtime_error("BIP32 child derivation produced IL == 0");
    }
    try {
      child.public_point_ = ECPoint::GeneratorMultiply(il).Add(public_point_);
    } catch (const std::invalid_argument&) {
      throw std::runtime_error("BIP32 child derivation produced the point at infinity");
    }
  }
  return child;
}

ExtendedKey ExtendedKey::Derive(const DerivationPath& path) const {
  ExtendedKey current = *this;
  for (const PathSegment& segment : path.segments()) {
    current = current.DeriveChild(segment.ChildNumber());
  }
  return current;
}

ExtendedKey ExtendedKey::Neuter() const {
  ExtendedKey out = *this;
  SecureZeroize(&out.private_scalar_);
  return out;
}

bool ExtendedKey::has_private_key() const {
  return private_scalar_.has_value();
}

const std::optional<Scalar>& ExtendedKey::private_scalar() const {
  return private_scalar_;
}

const ECPoint& ExtendedKey::public_point() const {
  return public_point_;
}

const std::array<uint8_t, 32>& ExtendedKey::chain_code() const {
  return chain_code_;
}

uint8_t ExtendedKey::depth() const {
  return depth_;
}

uint32_t ExtendedKey::parent_fingerprint() const {
  return parent_fingerprint_;
}

uint32_t ExtendedKey::child_number() const {
  return child_number_;
}

uint32_t ExtendedKey::Fingerprint() const {
  const Bytes id = Hash160(public_point_.compressed());
  return ReadU32Be(id, 0);
}

std::string ExtendedKey::ToBase58(const NetworkParams& params) const {
  Bytes payload;
  payload.reserve(kSerializedKeySize);
  AppendU32Be(has_private_key() ? params.xprv_version : params.xpub_version, &payload);
  payload.push_back(depth_);
  AppendU32Be(parent_fingerprint_, &payload);
  AppendU32Be(child_number_, &payload);
  payload.insert(payload.end(), chain_code_.begin(), chain_code_.end());
  if (has_private_key()) {
    std::array<uint8_t, 32> secret = private_scalar_->ToCanonicalBytes();
    payload.push_back(0x00);
    payload.insert(payload.end(), secret.begin(), secret.end());
    SecureZeroize(&secret);
  } else {
    const std::array<uint8_t, 33>& compressed = public_point_.compressed();
    payload.insert(payload.end(), compressed.begin(), compressed.end());
  }

  std::string encoded = EncodeBase58Check(payload);
  SecureZeroize(&payload);
  return encoded;
}

std::string ExtendedKey::ToXpub(const NetworkParams& params) const {
  return Neuter().ToBase58(params);
}

}  // namespace msig
