#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <string>
#include <vector>

#include "../../include/extension.hpp"

using enum peel::CompressionFormat;
using formats = std::vector<peel::CompressionFormat>;

namespace {

std::vector<std::string> texts_of(const std::vector<peel::Extension>& extensions) {
  std::vector<std::string> texts;
  for (const auto& extension : extensions) {
    texts.push_back(extension.display_text());
  }
  return texts;
}

} // namespace

SCENARIO("parsing a format string with known tokens") {
  auto text = GENERATE(as<std::string>{}, "tar.gz", ".tar.gz", "tar.gz.",
      "..tar...gz..", ".tar.gz.");
  GIVEN("format string '" + text + "'") {
    const auto extensions = peel::from_format_text(text);

    THEN("it yields one extension per token, last token first") {
      REQUIRE(extensions.has_value());
      CHECK(texts_of(*extensions) == std::vector<std::string>{"gz", "tar"});
      CHECK(peel::flatten_formats(*extensions) == formats{Gzip, Tar});
    }
  }
}

TEST_CASE("single tokens") {
  SECTION("simple token") {
    const auto extensions = peel::from_format_text("zip");
    REQUIRE(extensions.has_value());
    REQUIRE(extensions->size() == 1);
    CHECK(extensions->front().is_archive());
  }
  SECTION("compound token stays one extension") {
    const auto extensions = peel::from_format_text(".tgz");
    REQUIRE(extensions.has_value());
    REQUIRE(extensions->size() == 1);
    CHECK(extensions->front().display_text() == "tgz");
    CHECK(peel::flatten_formats(*extensions) == formats{Tar, Gzip});
  }
}

TEST_CASE("three tokens are reversed") {
  const auto extensions = peel::from_format_text("tar.xz.zst");
  REQUIRE(extensions.has_value());
  CHECK(texts_of(*extensions) == std::vector<std::string>{"zst", "xz", "tar"});
}

TEST_CASE("any unknown token rejects the whole string") {
  auto text = GENERATE(as<std::string>{}, "tar.rar", "rar.gz", "tar.gz.txt",
      "unknown", "TAR.GZ", "tar gz", "tar.gz/");
  INFO("format: '" << text << "'");
  CHECK_FALSE(peel::from_format_text(text).has_value());
}

TEST_CASE("no tokens at all yields an empty list") {
  auto text = GENERATE(as<std::string>{}, "", ".", "...");
  const auto extensions = peel::from_format_text(text);
  REQUIRE(extensions.has_value());
  CHECK(extensions->empty());
}
