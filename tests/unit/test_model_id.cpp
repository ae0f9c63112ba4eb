#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "model/model_id.h"

#include <filesystem>
#include <string>

using namespace hiyo;

TEST_CASE("ValidateModelId accepts owner/name identifiers", "[model_id]") {
  REQUIRE(ValidateModelId("mlx-community/Llama-3.2-3B-Instruct-4bit"));
  REQUIRE(ValidateModelId("a/b"));
  REQUIRE(ValidateModelId("my_org/model.v1_final"));
}

TEST_CASE("ValidateModelId rejects path traversal", "[model_id]") {
  std::string reason;
  REQUIRE_FALSE(ValidateModelId("../etc/passwd", &reason));
  REQUIRE_FALSE(reason.empty());
  REQUIRE_FALSE(ValidateModelId("owner/..", &reason));
  REQUIRE_FALSE(ValidateModelId("owner/name..x", &reason));
  REQUIRE_FALSE(ValidateModelId("owner/./name", &reason));
}

TEST_CASE("ValidateModelId rejects shell metacharacters", "[model_id]") {
  for (const char *id : {"owner/name;rm", "owner/na|me", "owner/a&b",
                         "owner/$HOME", "owner/`id`", "c:/name"}) {
    INFO(id);
    REQUIRE_FALSE(ValidateModelId(id));
  }
  std::string with_nul = "owner/na";
  with_nul.push_back('\0');
  with_nul += "me";
  REQUIRE_FALSE(ValidateModelId(with_nul));
}

TEST_CASE("ValidateModelId enforces the owner/name shape", "[model_id]") {
  for (const char *id :
       {"", "noslash", "/name", "owner/", "a/b/c", "own er/name",
        "owner/na me", "own.er/name"}) {
    INFO(id);
    REQUIRE_FALSE(ValidateModelId(id));
  }
}

TEST_CASE("ValidateModelId enforces the length limit", "[model_id]") {
  std::string at_limit = "o/" + std::string(kMaxModelIdLength - 2, 'n');
  REQUIRE(ValidateModelId(at_limit));
  std::string over = at_limit + "n";
  std::string reason;
  REQUIRE_FALSE(ValidateModelId(over, &reason));
  REQUIRE(reason.find("100") != std::string::npos);
}

TEST_CASE("ModelDirectoryPath nests the name under the owner",
          "[model_id]") {
  REQUIRE(ModelDirectoryPath("mlx-community/Phi-3-mini-4k-instruct-4bit") ==
          std::filesystem::path("mlx-community") /
              "Phi-3-mini-4k-instruct-4bit");
}

TEST_CASE("ModelDirectoryPath keeps underscore ids apart", "[model_id]") {
  REQUIRE(ValidateModelId("a_b/c"));
  REQUIRE(ValidateModelId("a/b_c"));
  REQUIRE(ModelDirectoryPath("a_b/c") != ModelDirectoryPath("a/b_c"));
}
