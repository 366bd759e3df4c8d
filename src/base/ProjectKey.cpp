#include "ProjectKey.hpp"

#include "TetherException.hpp"

#define SODIUM_FAIL(X)                                         \
  {                                                            \
    int rc = (X);                                              \
    if ((rc) == -1) STFATAL << "Crypto Error: (" << rc << ")"; \
  }

namespace tether {
namespace {
std::once_flag sodiumInitFlag;

void ensureSodium() {
  std::call_once(sodiumInitFlag, []() {
    if (-1 == sodium_init()) {
      STFATAL << "libsodium init failed";
    }
  });
}
}  // namespace

string normalizePath(const string &path) {
  if (path.empty()) {
    return path;
  }
  string normalized = fs::path(path).lexically_normal().string();
  while (normalized.length() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

string hashToHex(const string &input) {
  ensureSodium();
  unsigned char digest[PROJECT_KEY_BYTES];
  SODIUM_FAIL(crypto_generichash(digest, sizeof(digest),
                                 (const unsigned char *)input.data(),
                                 input.length(), NULL, 0));
  string hex(PROJECT_KEY_HEX_LENGTH + 1, '\0');
  sodium_bin2hex(&hex[0], hex.length(), digest, sizeof(digest));
  hex.resize(PROJECT_KEY_HEX_LENGTH);
  return hex;
}

ProjectKey ProjectKey::fromPath(const string &path) {
  return ProjectKey(hashToHex(normalizePath(path)));
}

ProjectKey ProjectKey::fromHex(const string &hex) {
  if (hex.length() != size_t(PROJECT_KEY_HEX_LENGTH)) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Invalid project key length: " + hex);
  }
  for (char c : hex) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      throw TetherException(ErrorKind::InvalidAction,
                            "Invalid project key: " + hex);
    }
  }
  return ProjectKey(hex);
}
}  // namespace tether
