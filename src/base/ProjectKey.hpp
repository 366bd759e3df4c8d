#ifndef __TETHER_PROJECT_KEY__
#define __TETHER_PROJECT_KEY__

#include "Headers.hpp"

namespace tether {
/** @brief Digest size used for project keys and worktree ids. */
const int PROJECT_KEY_BYTES = 16;
/** @brief Length of the hex rendering of a project key. */
const int PROJECT_KEY_HEX_LENGTH = PROJECT_KEY_BYTES * 2;

/**
 * @brief Lexically normalizes a project or worktree path.
 *
 * Collapses `.`/`..` components and strips trailing separators so that
 * `/a/b/` and `/a/./b` map to the same project.  Never touches the disk.
 */
string normalizePath(const string &path);

/**
 * @brief Hashes arbitrary bytes with BLAKE2b and returns lowercase hex.
 */
string hashToHex(const string &input);

/**
 * @brief Fixed-width identifier that isolates one project's persisted data.
 *
 * There is intentionally no default constructor: every persistence query
 * must be handed a key that came from a real project.
 */
class ProjectKey {
 public:
  /** @brief Derives the key for a project path (normalized first). */
  static ProjectKey fromPath(const string &path);
  /**
   * @brief Rebuilds a key that was previously derived and stored.
   * @throws TetherException(InvalidAction) if the string is not a key.
   */
  static ProjectKey fromHex(const string &hex);

  const string &hex() const { return value; }

  bool operator==(const ProjectKey &other) const {
    return value == other.value;
  }
  bool operator!=(const ProjectKey &other) const {
    return value != other.value;
  }
  bool operator<(const ProjectKey &other) const { return value < other.value; }

 protected:
  explicit ProjectKey(const string &_value) : value(_value) {}

  string value;
};
}  // namespace tether

#endif  // __TETHER_PROJECT_KEY__
