#include "scanner/pattern_catalog.h"

#include <utility>

namespace CryptoAudit {

namespace {

constexpr const char* REC_RSA =
  "Replace RSA with CRYSTALS-Dilithium (ML-DSA) for signatures or CRYSTALS-Kyber (ML-KEM) for encryption";
constexpr const char* REC_EC_SIGNATURE =
  "Replace with CRYSTALS-Dilithium (ML-DSA) or SPHINCS+ (SLH-DSA) for post-quantum signatures";
constexpr const char* REC_KEX =
  "Replace with CRYSTALS-Kyber (ML-KEM) for quantum-safe key establishment";
constexpr const char* REC_HASH =
  "Use SHA-256, SHA-3 or BLAKE2 instead";

auto pattern(const char* id, const char* name, const char* algorithm, PrimitiveFamily family,
             Severity severity, MatcherSpec matcher, std::vector<std::string> corroborating,
             const char* description, const char* recommendation) -> PatternSpec {
  PatternSpec spec;
  spec.id = id;
  spec.name = name;
  spec.algorithm = algorithm;
  spec.family = family;
  spec.severity = severity;
  spec.quantum_vulnerable = isQuantumVulnerableFamily(family);
  spec.matcher = std::move(matcher);
  spec.corroborating_imports = std::move(corroborating);
  spec.description = description;
  spec.recommendation = recommendation;
  return spec;
}

} // namespace

auto defaultCatalog() -> std::vector<PatternSpec> {
  std::vector<PatternSpec> catalog;
  catalog.reserve(15);

  const std::vector<std::string> rsa_imports = {
    "rsa", "crypto", "cryptography", "openssl", "node-forge", "jsencrypt",
    "java.security", "javax.crypto", "system.security.cryptography"};
  const std::vector<std::string> ec_imports = {
    "ecdsa", "ed25519", "elliptic", "crypto/ecdsa", "cryptography", "cryptodome",
    "java.security", "secp256k1", "p256"};
  const std::vector<std::string> hash_imports = {
    "hashlib", "crypto", "md5", "sha1", "openssl", "java.security", "digest"};
  const std::vector<std::string> cipher_imports = {
    "crypto", "cryptodome", "openssl", "javax.crypto", "crypto/des", "crypto/rc4"};

  // ---- Integer factorization (RSA) ----

  auto keygen = pattern(
    "QV-RSA-KEYGEN", "RSA key generation", "rsa",
    PrimitiveFamily::INTEGER_FACTORIZATION_PK, Severity::CRITICAL,
    CallShapeSpec{R"re(\brsa\.(generate_private_key|generate_key|generatekey|generate|newkeys)\b|\brsa_generate_key(_ex)?\b|keypairgenerator\.getinstance\(\s*"rsa"|generatekeypair(sync)?\(\s*['"]rsa['"]|\bnew\s+rsacryptoserviceprovider\b|\brsaprivatekey::new\b|\bevp_pkey_keygen\b)re", true},
    rsa_imports,
    "RSA key pair generation; RSA is broken by Shor's algorithm on a large quantum computer",
    REC_RSA);
  keygen.extracts_key_size = true;
  catalog.push_back(std::move(keygen));

  auto usage = pattern(
    "QV-RSA-USAGE", "RSA usage", "rsa",
    PrimitiveFamily::INTEGER_FACTORIZATION_PK, Severity::HIGH,
    TextualSpec{{"rsa"}},
    rsa_imports,
    "RSA public-key cryptography is quantum-vulnerable",
    REC_RSA);
  usage.extracts_key_size = true;
  catalog.push_back(std::move(usage));

  catalog.push_back(pattern(
    "QV-RSA-PADDING", "RSA padding scheme", "rsa",
    PrimitiveFamily::INTEGER_FACTORIZATION_PK, Severity::HIGH,
    ImportCorroboratedSpec{{"pkcs1_oaep", "pkcs1_v1_5", "pkcs1_15", "pkcs1v15", "oaep",
                            "rsa_pkcs1_padding", "rsa_pkcs1_oaep_padding"},
                           {"crypto", "cryptodome", "cryptography", "openssl"}},
    rsa_imports,
    "RSA encryption or signature padding; the underlying RSA key is quantum-vulnerable",
    REC_RSA));

  catalog.push_back(pattern(
    "WK-JWT-RSA", "JWT RSA signature algorithm", "rsa",
    PrimitiveFamily::INTEGER_FACTORIZATION_PK, Severity::LOW,
    TextualSpec{{"rs256", "rs384", "rs512", "ps256", "ps384", "ps512"}},
    {"jwt", "jose", "jsonwebtoken"},
    "JWT signed with an RSA algorithm (RS*/PS*); tokens are forgeable once RSA falls",
    "Plan migration of token signing to a post-quantum signature scheme (ML-DSA)"));

  // ---- Discrete logarithm (DSA) ----

  catalog.push_back(pattern(
    "QV-DSA", "DSA signatures", "dsa",
    PrimitiveFamily::DISCRETE_LOG_PK, Severity::HIGH,
    TextualSpec{{"dsa"}},
    {"crypto/dsa", "cryptography", "cryptodome", "java.security", "openssl"},
    "DSA (Digital Signature Algorithm) is quantum-vulnerable",
    "Replace with CRYSTALS-Dilithium (ML-DSA) for post-quantum digital signatures"));

  // ---- Elliptic curve ----

  catalog.push_back(pattern(
    "QV-ECDSA", "Elliptic-curve signatures", "ec",
    PrimitiveFamily::ELLIPTIC_CURVE_PK, Severity::HIGH,
    TextualSpec{{"ecdsa", "secp256k1", "secp256r1", "secp384r1", "secp521r1", "prime256v1",
                 "p-256", "p-384", "p-521", "ed25519", "ed448", "eddsa", "ecc"}},
    ec_imports,
    "Elliptic-curve signature (ECDSA/EdDSA) is quantum-vulnerable",
    REC_EC_SIGNATURE));

  catalog.push_back(pattern(
    "QV-EC-KEYGEN", "Elliptic-curve key generation", "ec",
    PrimitiveFamily::ELLIPTIC_CURVE_PK, Severity::CRITICAL,
    ImportCorroboratedSpec{{"ec.generate_private_key", "ecc.generate", "ecdsa.generatekey",
                            "signingkey.generate", "ed25519.generatekey"},
                           {"cryptography", "cryptodome", "crypto/ecdsa", "crypto/ed25519",
                            "ecdsa", "elliptic"}},
    ec_imports,
    "Elliptic-curve key pair generation; new long-lived EC keys are quantum-vulnerable",
    REC_EC_SIGNATURE));

  // ---- Key exchange ----

  catalog.push_back(pattern(
    "QV-ECDH", "Elliptic-curve Diffie-Hellman", "ecdh",
    PrimitiveFamily::KEY_EXCHANGE, Severity::HIGH,
    TextualSpec{{"ecdh", "ecdhe", "x25519", "x448", "curve25519"}},
    {"crypto/ecdh", "cryptography", "curve25519", "x25519", "openssl", "tweetnacl"},
    "ECDH (Elliptic Curve Diffie-Hellman) is quantum-vulnerable",
    REC_KEX));

  catalog.push_back(pattern(
    "QV-DH", "Finite-field Diffie-Hellman", "dh",
    PrimitiveFamily::KEY_EXCHANGE, Severity::HIGH,
    CallShapeSpec{R"re(diffie.?hellman|\bdh\.(generate_parameters|generate_private_key|generate)\b|\bdh_(generate_key|generate_parameters(_ex)?|new)\b|getinstance\(\s*"dh"|\bffdhe[0-9]+\b|\bdhe\b)re", true},
    {"cryptography", "crypto", "openssl", "javax.crypto"},
    "Diffie-Hellman key exchange is quantum-vulnerable",
    "Replace Diffie-Hellman key exchange with CRYSTALS-Kyber (ML-KEM) or NTRU"));

  // ---- Broken hashes ----

  catalog.push_back(pattern(
    "WK-MD5", "MD5 hash", "md5",
    PrimitiveFamily::BROKEN_HASH, Severity::HIGH,
    TextualSpec{{"md5"}},
    hash_imports,
    "MD5 is cryptographically broken (practical collisions)",
    REC_HASH));

  catalog.push_back(pattern(
    "WK-SHA1", "SHA-1 hash", "sha1",
    PrimitiveFamily::BROKEN_HASH, Severity::HIGH,
    TextualSpec{{"sha1", "sha-1", "sha_1"}},
    hash_imports,
    "SHA-1 is deprecated (practical chosen-prefix collisions)",
    REC_HASH));

  catalog.push_back(pattern(
    "WK-HMAC-SHA1", "HMAC-SHA1", "hmac-sha1",
    PrimitiveFamily::BROKEN_HASH, Severity::LOW,
    TextualSpec{{"hmac-sha1", "hmacsha1", "hmac_sha1", "hmac-sha-1"}},
    {"hmac", "crypto", "hashlib"},
    "HMAC-SHA1 is not yet broken but relies on a deprecated hash",
    "Use HMAC-SHA256 or HMAC-SHA3"));

  // ---- Deprecated ciphers ----

  catalog.push_back(pattern(
    "WK-DES", "DES cipher", "des",
    PrimitiveFamily::DEPRECATED_BLOCK_CIPHER, Severity::HIGH,
    CallShapeSpec{R"re(\bDES(\b|_)|\bdes-(cbc|ecb|cfb|ofb)\b|\bDESCryptoServiceProvider\b|\bdes\.NewCipher\b|createCipheriv\(\s*['"]des['"])re", false},
    cipher_imports,
    "DES uses a 56-bit key and is brute-forceable",
    "Use AES-256-GCM or ChaCha20-Poly1305"));

  catalog.push_back(pattern(
    "WK-3DES", "Triple DES cipher", "3des",
    PrimitiveFamily::DEPRECATED_BLOCK_CIPHER, Severity::MEDIUM,
    TextualSpec{{"3des", "tripledes", "triple_des", "desede", "des-ede3", "des_ede3", "des3"}},
    cipher_imports,
    "Triple DES is deprecated (64-bit block, Sweet32)",
    "Use AES-256-GCM or ChaCha20-Poly1305"));

  catalog.push_back(pattern(
    "WK-RC4", "RC4 stream cipher", "rc4",
    PrimitiveFamily::BROKEN_STREAM_CIPHER, Severity::HIGH,
    TextualSpec{{"rc4", "arcfour", "arc4"}},
    cipher_imports,
    "RC4 has exploitable keystream biases",
    "Use AES-256-GCM or ChaCha20-Poly1305"));

  return catalog;
}

} // namespace CryptoAudit
