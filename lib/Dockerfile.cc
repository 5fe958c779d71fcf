#include "Dockerfile.hpp"

#include "Algos.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <regex>
#include <rs/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace imgbuild {

static std::string escapeRegex(const std::string_view str) {
  static constexpr std::string_view special = R"(\^$.|?*+()[]{}/-)";
  std::string escaped;
  escaped.reserve(str.size() * 2);
  for (const char c : str) {
    if (special.find(c) != std::string_view::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

std::vector<FromInstruction> parseFromInstructions(const std::string_view text) {
  static const std::regex fromPattern(
      R"(^FROM\s+(?:--platform=(\S+)\s+)?(\S+)(?:\s+AS\s+(\S+))?$)",
      std::regex::ECMAScript | std::regex::icase);

  std::vector<FromInstruction> instructions;
  std::istringstream iss{ std::string(text) };
  std::string line;
  while (std::getline(iss, line)) {
    const std::string trimmed(trim(line));
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    std::smatch match;
    if (!std::regex_match(trimmed, match, fromPattern)) {
      continue;
    }

    FromInstruction instruction{ .image = match[2].str(),
                                 .stageName = std::nullopt,
                                 .platform = std::nullopt };
    if (match[1].matched) {
      instruction.platform = match[1].str();
    }
    if (match[3].matched) {
      instruction.stageName = match[3].str();
    }
    instructions.emplace_back(std::move(instruction));
  }
  return instructions;
}

std::string rewriteFromReferences(const std::string& text,
                                  const std::string_view oldRef,
                                  const std::string_view newRef) {
  const std::regex fromRegex("FROM\\s+" + escapeRegex(oldRef)
                             + "(?=\\s|$)([ \\t]*)");

  std::string result;
  result.reserve(text.size());
  auto last = text.cbegin();
  for (auto itr = std::sregex_iterator(text.begin(), text.end(), fromRegex);
       itr != std::sregex_iterator(); ++itr) {
    const std::smatch& match = *itr;
    result.append(last, match[0].first);
    result.append("FROM ");
    result.append(newRef);

    const auto after = match[0].second;
    const bool endsLine = after == text.cend() || *after == '\n'
                          || *after == '\r';
    if (!endsLine) {
      result.append(match[1].first, match[1].second);
    }
    last = after;
  }
  result.append(last, text.cend());
  return result;
}

rs::Result<std::string> readTextFile(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  rs_ensure(ifs.is_open(), "failed to open `{}`: {}", path.string(),
            std::strerror(errno));

  std::string content{ std::istreambuf_iterator<char>(ifs),
                       std::istreambuf_iterator<char>() };
  rs_ensure(!ifs.bad(), "failed to read `{}`", path.string());
  return rs::Ok(std::move(content));
}

rs::Result<void> writeTextFile(const fs::path& path,
                               const std::string_view text) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  rs_ensure(ofs.is_open(), "failed to create `{}`: {}", path.string(),
            std::strerror(errno));

  ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  ofs.close();
  rs_ensure(!ofs.fail(), "failed to write `{}`", path.string());
  return rs::Ok();
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static void testRewriteSimple() {
  const std::string rewritten =
      rewriteFromReferences("FROM repoA:tag1\nRUN echo hi\n", "repoA:tag1",
                            "repoB:tag1");
  assertEq(rewritten, "FROM repoB:tag1\nRUN echo hi\n");
  assertFalse(rewritten.contains("FROM repoA:tag1"));

  pass();
}

static void testRewriteAllOccurrences() {
  const std::string dockerfile = "FROM repoA:tag1 AS build\n"
                                 "RUN make\n"
                                 "FROM    repoA:tag1   \n"
                                 "COPY --from=build /out /app\n";
  assertEq(rewriteFromReferences(dockerfile, "repoA:tag1", "repoB:tag1"),
           "FROM repoB:tag1 AS build\n"
           "RUN make\n"
           "FROM repoB:tag1\n"
           "COPY --from=build /out /app\n");

  pass();
}

static void testRewriteKeepsOtherReferences() {
  const std::string dockerfile = "FROM repoA:tag10\n"
                                 "FROM repoA:tag1\n"
                                 "FROM other/repoA:tag1\n"
                                 "from repoA:tag1\n";
  assertEq(rewriteFromReferences(dockerfile, "repoA:tag1", "repoB:tag1"),
           "FROM repoA:tag10\n"
           "FROM repoB:tag1\n"
           "FROM other/repoA:tag1\n"
           "from repoA:tag1\n");

  pass();
}

static void testRewriteEscapesReference() {
  const std::string dockerfile = "FROM base.io/img:1.0\nFROM baseXio/img:1X0\n";
  assertEq(rewriteFromReferences(dockerfile, "base.io/img:1.0",
                                 "mirror.io/img:1.0"),
           "FROM mirror.io/img:1.0\nFROM baseXio/img:1X0\n");

  pass();
}

static void testRewriteAtEndOfText() {
  assertEq(rewriteFromReferences("FROM repoA:tag1", "repoA:tag1", "repoB:tag1"),
           "FROM repoB:tag1");
  assertEq(rewriteFromReferences("FROM repoA:tag1 \r\nRUN x", "repoA:tag1",
                                 "repoB:tag1"),
           "FROM repoB:tag1\r\nRUN x");

  pass();
}

static void testParseFromInstructions() {
  const auto instructions = parseFromInstructions(
      "# syntax=docker/dockerfile:1\n"
      "ARG REPO=mcr.example.com/dotnet/sdk\n"
      "FROM --platform=linux/amd64 $REPO:8.0 AS installer\n"
      "RUN dotnet --info\n"
      "  from dotnet/runtime-deps:8.0\n"
      "COPY --from=installer /dotnet /usr/share/dotnet\n");

  assertEq(instructions.size(), 2UL);
  assertEq(instructions[0].image, "$REPO:8.0");
  assertTrue(instructions[0].platform.has_value());
  assertEq(instructions[0].platform.value(), "linux/amd64");
  assertTrue(instructions[0].stageName.has_value());
  assertEq(instructions[0].stageName.value(), "installer");
  assertEq(instructions[1].image, "dotnet/runtime-deps:8.0");
  assertFalse(instructions[1].stageName.has_value());

  pass();
}

} // namespace tests

int main() {
  tests::testRewriteSimple();
  tests::testRewriteAllOccurrences();
  tests::testRewriteKeepsOtherReferences();
  tests::testRewriteEscapesReference();
  tests::testRewriteAtEndOfText();
  tests::testParseFromInstructions();
}

#endif
