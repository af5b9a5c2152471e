// =============================================================================
// ConnectorHubAsync - Crypto Module
// =============================================================================
// Contains: AES-128 payload codec, AccessToken, accessory identity
// =============================================================================

#include "ConnectorHubInternal.h"

namespace ConnectorHubInternal {

bool keyIsUsable(const char *key) {
  return key != nullptr && strlen(key) == kChubKeyLen;
}

void bytesToHexUpper(const uint8_t *in, size_t len, char *out) {
  static const char kHex[] = "0123456789ABCDEF";
  for (size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[in[i] >> 4];
    out[i * 2 + 1] = kHex[in[i] & 0x0F];
  }
  out[len * 2] = '\0';
}

// Returns the unpadded length, or `len` itself when the padding is invalid
size_t pkcs7Unpad(const uint8_t *buffer, size_t len) {
  if (len == 0 || len % kAesBlock != 0) return len;
  uint8_t pad = buffer[len - 1];
  if (pad == 0 || pad > kAesBlock) return len;
  for (size_t i = len - pad; i < len; ++i) {
    if (buffer[i] != pad) return len;
  }
  return len - pad;
}

}  // namespace ConnectorHubInternal

// =========================
// Payload Codec
// =========================

size_t ConnectorHub_encrypt(const uint8_t *plain, size_t len, const char *key,
                            uint8_t *out, size_t outCap) {
  if (!keyIsUsable(key) || out == nullptr) return 0;
  if (plain == nullptr && len > 0) return 0;

  size_t pad = kAesBlock - (len % kAesBlock);
  size_t total = len + pad;
  if (total > outCap) return 0;

  if (len > 0) memmove(out, plain, len);
  memset(out + len, static_cast<uint8_t>(pad), pad);

  mbedtls_aes_context aes;
  mbedtls_aes_init(&aes);
  if (mbedtls_aes_setkey_enc(&aes, reinterpret_cast<const uint8_t *>(key), 128) != 0) {
    mbedtls_aes_free(&aes);
    return 0;
  }
  for (size_t off = 0; off < total; off += kAesBlock) {
    mbedtls_aes_crypt_ecb(&aes, MBEDTLS_AES_ENCRYPT, out + off, out + off);
  }
  mbedtls_aes_free(&aes);
  return total;
}

ChubErr ConnectorHub_decrypt(const uint8_t *cipher, size_t len, const char *key,
                             uint8_t *out, size_t outCap, size_t &outLen) {
  outLen = 0;
  if (!keyIsUsable(key)) return ChubErr::INVALID_CONFIG;
  if (cipher == nullptr || out == nullptr) return ChubErr::DECRYPT_FAIL;
  if (len == 0 || len % kAesBlock != 0 || len > outCap) return ChubErr::DECRYPT_FAIL;

  mbedtls_aes_context aes;
  mbedtls_aes_init(&aes);
  if (mbedtls_aes_setkey_dec(&aes, reinterpret_cast<const uint8_t *>(key), 128) != 0) {
    mbedtls_aes_free(&aes);
    return ChubErr::DECRYPT_FAIL;
  }
  for (size_t off = 0; off < len; off += kAesBlock) {
    if (mbedtls_aes_crypt_ecb(&aes, MBEDTLS_AES_DECRYPT, cipher + off, out + off) != 0) {
      mbedtls_aes_free(&aes);
      return ChubErr::DECRYPT_FAIL;
    }
  }
  mbedtls_aes_free(&aes);

  size_t plainLen = pkcs7Unpad(out, len);
  if (plainLen == len) {
    // Wrong key or corrupted ciphertext. Never hand back the garbage.
    memset(out, 0, len);
    return ChubErr::DECRYPT_FAIL;
  }
  outLen = plainLen;
  return ChubErr::OK;
}

bool ConnectorHub_accessToken(const char *token, const char *key, char *out, size_t outSize) {
  if (out == nullptr || outSize < kAesBlock * 2 + 1) return false;
  if (!keyIsUsable(key)) return false;
  if (token == nullptr || strlen(token) != kChubTokenLen) return false;

  uint8_t block[kAesBlock];
  mbedtls_aes_context aes;
  mbedtls_aes_init(&aes);
  if (mbedtls_aes_setkey_enc(&aes, reinterpret_cast<const uint8_t *>(key), 128) != 0 ||
      mbedtls_aes_crypt_ecb(&aes, MBEDTLS_AES_ENCRYPT,
                            reinterpret_cast<const uint8_t *>(token), block) != 0) {
    mbedtls_aes_free(&aes);
    return false;
  }
  mbedtls_aes_free(&aes);

  bytesToHexUpper(block, sizeof(block), out);
  return true;
}

// =========================
// Accessory Identity
// =========================

void ConnectorHub_accessoryIdentity(const char *mac, char *out, size_t outSize) {
  if (out == nullptr || outSize < kChubIdentitySize) return;
  if (mac == nullptr) mac = "";

  uint8_t digest[20];
  mbedtls_sha1_context ctx;
  mbedtls_sha1_init(&ctx);
  mbedtls_sha1_starts(&ctx);
  mbedtls_sha1_update(&ctx, reinterpret_cast<const uint8_t *>(mac), strlen(mac));
  mbedtls_sha1_finish(&ctx, digest);
  mbedtls_sha1_free(&ctx);

  static const char kHex[] = "0123456789abcdef";
  static const char kPattern[] = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";

  // Digest nibbles are consumed in order, one per 'x' or 'y'
  size_t nibble = 0;
  size_t i = 0;
  for (; kPattern[i] != '\0'; ++i) {
    char c = kPattern[i];
    if (c != 'x' && c != 'y') {
      out[i] = c;
      continue;
    }
    uint8_t byte = digest[nibble / 2];
    uint8_t value = (nibble % 2 == 0) ? (byte >> 4) : (byte & 0x0F);
    ++nibble;
    if (c == 'y') value = static_cast<uint8_t>((value & 0x3) | 0x8);
    out[i] = kHex[value];
  }
  out[i] = '\0';
}
