#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "../../include/extension.hpp"

using enum peel::CompressionFormat;
using formats = std::vector<peel::CompressionFormat>;
namespace fs = std::filesystem;

TEST_CASE("extensions_from_path") {
  SECTION("tarball yields tar then gzip") {
    const auto extensions = peel::extensions_from_path(fs::path("bolovo.tar.gz"));
    CHECK(peel::flatten_formats(extensions) == formats{Tar, Gzip});
  }
  SECTION("zip is a single archive layer") {
    const auto extensions = peel::extensions_from_path(fs::path("archive.zip"));
    REQUIRE(extensions.size() == 1);
    CHECK(peel::flatten_formats(extensions) == formats{Zip});
    CHECK(extensions.front().is_archive());
  }
  SECTION("compound extension") {
    const auto extensions = peel::extensions_from_path(fs::path("backup.tzst"));
    REQUIRE(extensions.size() == 1);
    CHECK(peel::flatten_formats(extensions) == formats{Tar, Zstd});
  }
}

TEST_CASE("separate_known_extensions_from_name") {
  SECTION("unknown extension is left alone") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("notes.txt");
    CHECK(base == fs::path("notes.txt"));
    CHECK(extensions.empty());
  }
  SECTION("stripping stops at the first unknown extension") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("photo.tar.txt.gz");
    CHECK(base == fs::path("photo.tar.txt"));
    CHECK(peel::flatten_formats(extensions) == formats{Gzip});
  }
  SECTION("parent directories are kept") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("dir/sub/data.tar.xz");
    CHECK(base == fs::path("dir/sub/data"));
    CHECK(peel::join_display_text(extensions) == "tar.xz");
  }
  SECTION("dots inside the stem survive") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("v1.2.tar.bz2");
    CHECK(base == fs::path("v1.2"));
    CHECK(peel::flatten_formats(extensions) == formats{Tar, Bzip});
  }
  SECTION("a name made only of a hidden extension has no extension") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name(".gz");
    CHECK(base == fs::path(".gz"));
    CHECK(extensions.empty());
  }
  SECTION("a name that is itself an extension token keeps it as stem") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("tar.gz");
    CHECK(base == fs::path("tar"));
    CHECK(peel::flatten_formats(extensions) == formats{Gzip});
  }
  SECTION("trailing dot") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("file.");
    CHECK(base == fs::path("file."));
    CHECK(extensions.empty());
  }
  SECTION("trailing separator is ignored") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("dir/a.tar.gz/");
    CHECK(base == fs::path("dir/a"));
    CHECK(peel::flatten_formats(extensions) == formats{Tar, Gzip});
  }
  SECTION("trailing current directory component is ignored") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name("a.tgz/.");
    CHECK(base == fs::path("a"));
    CHECK(peel::flatten_formats(extensions) == formats{Tar, Gzip});
  }
  SECTION("root and current directory have nothing to strip") {
    CHECK(peel::extensions_from_path("/").empty());
    CHECK(peel::extensions_from_path(".").empty());
  }
  SECTION("empty path") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name(fs::path());
    CHECK(base.empty());
    CHECK(extensions.empty());
  }
}

SCENARIO("stripping extensions loses no information") {
  auto name = GENERATE(as<std::string>{}, "bolovo.tar.gz", "archive.zip",
      "notes.txt", "dir/sub/data.tgz", "a.b.tar.xz", "photo.tar.txt.gz",
      ".gz", "tar.gz", "file.", "x.tar.lz4.zst");
  GIVEN("path '" + name + "'") {
    const auto [base, extensions] = peel::separate_known_extensions_from_name(name);

    THEN("base plus the dotted extensions is the original path") {
      std::string rebuilt = base.string();
      for (const auto& extension : extensions) {
        rebuilt += "." + extension.display_text();
      }
      CHECK(fs::path(rebuilt) == fs::path(name));
    }
  }
}

// The two parsers disagree on order for the same text: a format string is
// reported innermost layer first, a path outermost layer first. Consumers
// building a pipeline must account for this.
TEST_CASE("format string and path report layers in opposite order") {
  const auto from_text = peel::from_format_text("tar.gz");
  const auto from_path = peel::extensions_from_path("name.tar.gz");

  REQUIRE(from_text.has_value());
  CHECK(peel::flatten_formats(*from_text) == formats{Gzip, Tar});
  CHECK(peel::flatten_formats(from_path) == formats{Tar, Gzip});
  CHECK(std::vector(from_text->rbegin(), from_text->rend()) == from_path);
}
