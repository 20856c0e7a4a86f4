#include <array>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmpxx.h>

#include "msig/common/bytes.hpp"
#include "msig/crypto/base58.hpp"
#include "msig/crypto/bech32.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/crypto/ecdsa.hpp"
#include "msig/crypto/encoding.hpp"
#include "msig/crypto/hash.hpp"
#include "msig/crypto/random.hpp"
#include "msig/crypto/scalar.hpp"

namespace {

using msig::Bytes;
using msig::DecodeBase58Check;
using msig::DecodeSegwitAddress;
using msig::ECPoint;
using msig::EcdsaSign;
using msig::EcdsaVerify;
using msig::EncodeBase58;
using msig::EncodeBase58Check;
using msig::EncodeSegwitAddress;
using msig::HexDecode;
using msig::HexEncode;
using msig::Scalar;
using msig::Sha256;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

Bytes AsBytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

std::array<uint8_t, 32> MpzTo32(const mpz_class& x) {
  std::array<uint8_t, 32> out{};
  size_t count = 0;
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, x.get_mpz_t());
  if (count > out.size()) {
    throw std::runtime_error("Value too large for 32-byte encoding");
  }

  std::array<uint8_t, 32> aligned{};
  const size_t offset = aligned.size() - count;
  for (size_t i = 0; i < count; ++i) {
    aligned[offset + i] = out[i];
  }
  return aligned;
}

void TestHex() {
  const Bytes data = {0x00, 0x01, 0xab, 0xff};
  Expect(HexEncode(data) == "0001abff", "HexEncode emits lowercase pairs");
  Expect(HexDecode("0001ABff") == data, "HexDecode accepts mixed case");
  ExpectThrow([]() { (void)HexDecode("abc"); }, "HexDecode rejects odd length");
  ExpectThrow([]() { (void)HexDecode("zz"); }, "HexDecode rejects non-hex characters");
}

void TestScalarEncodingAndReduction() {
  Scalar five(mpz_class(5));
  const auto five_bytes = five.ToCanonicalBytes();
  Expect(five_bytes[31] == 5, "Scalar canonical encoding should match value");

  Scalar reduced(Scalar::ModulusN() + 7);
  Expect(reduced == Scalar(mpz_class(7)), "Scalar constructor must reduce mod n");

  const auto n_bytes = MpzTo32(Scalar::ModulusN());
  ExpectThrow([&]() { (void)Scalar::FromCanonicalBytes(n_bytes); },
              "Canonical scalar decoding rejects >= n");

  Scalar zero = Scalar::FromBigEndianModN(n_bytes);
  Expect(zero.IsZero(), "Non-canonical decoder should reduce mod n");

  const Scalar minus_one = Scalar(mpz_class(0)) - Scalar::FromUint64(1);
  Expect(minus_one + Scalar::FromUint64(1) == Scalar(), "Scalar subtraction wraps mod n");
}

void TestPointEncoding() {
  const ECPoint g = ECPoint::GeneratorMultiply(Scalar::FromUint64(1));
  const Bytes compressed = g.ToCompressedBytes();
  Expect(HexEncode(compressed) == "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798",
         "Generator compressed encoding");
  const ECPoint parsed = ECPoint::FromCompressed(compressed);
  Expect(parsed == g, "ECPoint round-trip must preserve valid points");
  Expect(ECPoint::IsValidCompressed(compressed), "IsValidCompressed accepts the generator");

  Bytes invalid_prefix = compressed;
  invalid_prefix[0] = 0x04;
  ExpectThrow([&]() { (void)ECPoint::FromCompressed(invalid_prefix); },
              "ECPoint rejects non-compressed prefix");
  Expect(!ECPoint::IsValidCompressed(invalid_prefix), "IsValidCompressed rejects 0x04 prefix");

  Bytes invalid_len(32, 0x02);
  ExpectThrow([&]() { (void)ECPoint::FromCompressed(invalid_len); },
              "ECPoint rejects invalid length");

  Bytes invalid_curve(33, 0x00);
  invalid_curve[0] = 0x02;
  ExpectThrow([&]() { (void)ECPoint::FromCompressed(invalid_curve); },
              "ECPoint rejects bytes not on secp256k1 curve");
}

void TestPointArithmeticAndOrder() {
  const ECPoint g = ECPoint::GeneratorMultiply(Scalar::FromUint64(1));
  const ECPoint g2 = ECPoint::GeneratorMultiply(Scalar::FromUint64(2));
  const ECPoint g3 = ECPoint::GeneratorMultiply(Scalar::FromUint64(3));

  Expect(g.Add(g2) == g3, "ECPoint::Add should match scalar multiplication");
  Expect(g < g2 && g2 < g3, "Point order follows compressed bytes (0279.. < 02c6.. < 02f9..)");
  Expect(!(g3 < g), "Point order is antisymmetric");

  ExpectThrow([&]() { (void)ECPoint::GeneratorMultiply(Scalar::FromUint64(0)); },
              "GeneratorMultiply rejects zero scalar");
}

void TestHashes() {
  const Bytes abc = AsBytes("abc");
  Expect(HexEncode(Sha256(abc)) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA256 must match known test vector for 'abc'");
  Expect(HexEncode(msig::Ripemd160(Bytes{})) == "9c1185a5c5e9fc54612808977ee8f548b2258d31",
         "RIPEMD160 of empty input");
  Expect(HexEncode(msig::Ripemd160(abc)) == "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc",
         "RIPEMD160 of 'abc'");
  Expect(msig::Hash160(abc) == msig::Ripemd160(Sha256(abc)), "Hash160 is RIPEMD160(SHA256)");
  Expect(msig::DoubleSha256(abc) == Sha256(Sha256(abc)), "DoubleSha256 composes SHA256 twice");

  const Bytes key(20, 0x0b);
  Expect(HexEncode(msig::HmacSha512(key, AsBytes("Hi There"))) ==
             "87aa7cdea5ef619d4ff0b4241a1d6cb02379f4e2ce4ec2787ad0b30545e17cde"
             "daa833b7d6b8a702038b274eaea3f4e4be9d914eeb61f1702e696c203a126854",
         "HMAC-SHA512 RFC4231 case 1");

  const Bytes seed = msig::Pbkdf2HmacSha512(
      "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about",
      "mnemonic", 2048, 64);
  Expect(HexEncode(seed) ==
             "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
             "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4",
         "PBKDF2-HMAC-SHA512 matches the BIP39 seed vector");
  ExpectThrow([]() { (void)msig::Pbkdf2HmacSha512("x", "y", 0, 64); }, "PBKDF2 rejects zero iterations");
}

void TestEcdsa() {
  const Scalar one = Scalar::FromUint64(1);
  const ECPoint g = ECPoint::GeneratorMultiply(one);
  const Bytes digest = Sha256(AsBytes("abc"));

  const Bytes sig = EcdsaSign(digest, one);
  Expect(HexEncode(sig) ==
             "3044022075601b1385909ea698e3fd6e26e5fa5105127bd2299d3ab0b9d9f93df5b8b99c"
             "022028ae7cc8f969e6b6fb1feac477818a75a46e8c364e88dfdc9880e1a5175c4bd1",
         "RFC6979 low-S DER signature for key 1 over SHA256('abc')");
  Expect(EcdsaSign(digest, one) == sig, "ECDSA signing is deterministic");
  Expect(EcdsaVerify(digest, sig, g), "Signature verifies under the signing key");

  const ECPoint g2 = ECPoint::GeneratorMultiply(Scalar::FromUint64(2));
  Expect(!EcdsaVerify(digest, sig, g2), "Signature fails under another key");

  Bytes other_digest = digest;
  other_digest[0] ^= 0x01;
  Expect(!EcdsaVerify(other_digest, sig, g), "Signature fails for another digest");

  Bytes garbage = sig;
  garbage[0] = 0x31;
  Expect(!EcdsaVerify(digest, garbage, g), "Malformed DER is rejected");

  ExpectThrow([&]() { (void)EcdsaSign(Bytes(31, 0x01), one); }, "EcdsaSign requires a 32-byte digest");
  ExpectThrow([&]() { (void)EcdsaSign(digest, Scalar()); }, "EcdsaSign rejects the zero key");

  for (int i = 0; i < 8; ++i) {
    const Scalar key = msig::Csprng::RandomScalar();
    const Bytes d = Sha256(msig::Csprng::RandomBytes(32));
    const Bytes s = EcdsaSign(d, key);
    // DER SEQUENCE; low-S keeps s at most 32 bytes plus sign padding.
    Expect(s.size() <= 72 && s[0] == 0x30, "Signature is a DER sequence");
    Expect(EcdsaVerify(d, s, ECPoint::GeneratorMultiply(key)), "Random signature verifies");
  }
}

void TestBase58() {
  Expect(EncodeBase58(Bytes{0x00, 0x00, 0x01}) == "112", "Leading zero bytes map to '1'");
  Expect(EncodeBase58(AsBytes("hello world")) == "StV1DL6CwTryKyV", "Base58 of 'hello world'");

  Bytes decoded;
  Expect(msig::DecodeBase58("StV1DL6CwTryKyV", &decoded) && decoded == AsBytes("hello world"),
         "Base58 decode of 'hello world'");
  Expect(!msig::DecodeBase58("0OIl", &decoded), "Base58 rejects characters outside the alphabet");

  Bytes payload = HexDecode("00751e76e8199196d454941c45d1b3a323f1433bd6");
  const std::string address = EncodeBase58Check(payload);
  Expect(address == "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", "Base58Check P2PKH vector");

  Bytes out;
  Expect(DecodeBase58Check(address, &out) && out == payload, "Base58Check decode");
  std::string corrupted = address;
  corrupted.back() = corrupted.back() == 'H' ? 'J' : 'H';
  Expect(!DecodeBase58Check(corrupted, &out), "Base58Check rejects a bad checksum");
}

void TestBech32() {
  const Bytes program20 = HexDecode("751e76e8199196d454941c45d1b3a323f1433bd6");
  Expect(EncodeSegwitAddress("bc", 0, program20) == "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4",
         "BIP173 mainnet P2WPKH");
  Expect(EncodeSegwitAddress("tb", 0, program20) == "tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx",
         "BIP173 testnet P2WPKH");

  const Bytes program32 = HexDecode("1863143c14c5166804bd19203356da136c985678cd4d27a1b8c6329604903262");
  const std::string p2wsh = "tb1qrp33g0q5c5txsp9arysrx4k6zdkfs4nce4xj0gdcccefvpysxf3q0sl5k7";
  Expect(EncodeSegwitAddress("tb", 0, program32) == p2wsh, "BIP173 testnet P2WSH");

  uint8_t version = 0xFF;
  std::vector<uint8_t> program;
  Expect(DecodeSegwitAddress(p2wsh, "tb", &version, &program), "Decode testnet P2WSH");
  Expect(version == 0 && program == program32, "Decoded P2WSH program matches");

  std::string upper = "BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4";
  Expect(DecodeSegwitAddress(upper, "bc", &version, &program) && program == program20,
         "Uppercase addresses decode");
  Expect(!DecodeSegwitAddress("bc1qW508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", "bc", &version, &program),
         "Mixed case is rejected");
  Expect(!DecodeSegwitAddress(p2wsh, "bc", &version, &program), "Wrong HRP is rejected");

  std::string flipped = p2wsh;
  flipped[10] = flipped[10] == 'q' ? 'p' : 'q';
  Expect(!DecodeSegwitAddress(flipped, "tb", &version, &program), "Bad checksum is rejected");

  Bytes program_v1(32);
  for (size_t i = 0; i < program_v1.size(); ++i) {
    program_v1[i] = static_cast<uint8_t>(i);
  }
  const std::string v1 = EncodeSegwitAddress("tb", 1, program_v1);
  Expect(v1 == "tb1pqqqsyqcyq5rqwzqfpg9scrgwpugpzysnzs23v9ccrydpk8qarc0slua5fd", "Bech32m for version 1");
  Expect(DecodeSegwitAddress(v1, "tb", &version, &program) && version == 1 && program == program_v1,
         "Bech32m round-trip");

  ExpectThrow([&]() { (void)EncodeSegwitAddress("bc", 0, Bytes(21, 0x00)); },
              "Version 0 only allows 20- or 32-byte programs");
}

void TestSizedFields() {
  Bytes encoded;
  msig::AppendU32Be(7, &encoded);
  msig::AppendSizedField(Bytes{0xAA, 0xBB}, &encoded);
  msig::AppendU64Be(0x0102030405060708ull, &encoded);

  size_t offset = 0;
  Expect(msig::ReadU32Be(encoded, &offset) == 7, "u32 field");
  Expect(msig::ReadSizedField(encoded, &offset, 16, "field") == Bytes({0xAA, 0xBB}), "sized field");
  Expect(msig::ReadU64Be(encoded, &offset) == 0x0102030405060708ull, "u64 field");
  Expect(offset == encoded.size(), "All bytes consumed");

  size_t bounded = 4;
  ExpectThrow([&]() { (void)msig::ReadSizedField(encoded, &bounded, 1, "field"); },
              "Sized field above max_len is rejected");

  Bytes truncated = encoded;
  truncated.resize(6);
  size_t at = 4;
  ExpectThrow([&]() { (void)msig::ReadSizedField(truncated, &at, 16, "field"); },
              "Truncated sized field is rejected");

  const ECPoint g = ECPoint::GeneratorMultiply(Scalar::FromUint64(1));
  Expect(msig::DecodePoint(msig::EncodePoint(g)) == g, "Point codec");
}

void TestCsprng() {
  const Bytes random16 = msig::Csprng::RandomBytes(16);
  Expect(random16.size() == 16, "Csprng::RandomBytes should return requested length");
  Expect(msig::Csprng::RandomBytes(32) != msig::Csprng::RandomBytes(32), "Two draws differ");

  const Scalar s = msig::Csprng::RandomScalar();
  Expect(!s.IsZero() && s.value() < Scalar::ModulusN(), "Csprng::RandomScalar returns a value in [1, n-1]");
}

}  // namespace

int main() {
  try {
    TestHex();
    TestScalarEncodingAndReduction();
    TestPointEncoding();
    TestPointArithmeticAndOrder();
    TestHashes();
    TestEcdsa();
    TestBase58();
    TestBech32();
    TestSizedFields();
    TestCsprng();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Crypto primitives tests passed" << '\n';
  return 0;
}
