#include "ProjectKey.hpp"

#include "TestHeaders.hpp"
#include "TetherException.hpp"

using namespace tether;

TEST_CASE("normalizePath collapses equivalent spellings", "[ProjectKey]") {
  REQUIRE(normalizePath("/a/b/") == "/a/b");
  REQUIRE(normalizePath("/a/./b") == "/a/b");
  REQUIRE(normalizePath("/a/c/../b") == "/a/b");
  REQUIRE(normalizePath("/") == "/");
  REQUIRE(normalizePath("") == "");
}

TEST_CASE("Project keys are fixed width lowercase hex", "[ProjectKey]") {
  ProjectKey key = ProjectKey::fromPath("/home/user/repo");
  REQUIRE(key.hex().length() == size_t(PROJECT_KEY_HEX_LENGTH));
  for (char c : key.hex()) {
    REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
  }
}

TEST_CASE("Project keys are stable across path spellings", "[ProjectKey]") {
  REQUIRE(ProjectKey::fromPath("/home/user/repo") ==
          ProjectKey::fromPath("/home/user/repo/"));
  REQUIRE(ProjectKey::fromPath("/home/user/repo") ==
          ProjectKey::fromPath("/home/user/./repo"));
  REQUIRE(ProjectKey::fromPath("/home/user/repo") !=
          ProjectKey::fromPath("/home/user/repo2"));
}

TEST_CASE("fromHex accepts derived keys and rejects anything else",
          "[ProjectKey]") {
  ProjectKey key = ProjectKey::fromPath("/repo");
  REQUIRE(ProjectKey::fromHex(key.hex()) == key);

  REQUIRE_THROWS_AS(ProjectKey::fromHex(""), TetherException);
  REQUIRE_THROWS_AS(ProjectKey::fromHex("abc"), TetherException);
  string upper = key.hex();
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  if (upper != key.hex()) {
    REQUIRE_THROWS_AS(ProjectKey::fromHex(upper), TetherException);
  }
  REQUIRE_THROWS_AS(ProjectKey::fromHex(string(PROJECT_KEY_HEX_LENGTH, 'z')),
                    TetherException);
}
