#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>

namespace {

constexpr const char* MANIFEST = R"(
registry = "mcr.example.com"

[[repos]]
name = "dotnet/runtime-deps"

[[repos.images]]
shared-tags = ["8.0"]

[[repos.images.platforms]]
dockerfile = "src/runtime-deps/Dockerfile"
tags = ["8.0-amd64", { name = "8.0-local", local = true }]

[[repos.images.platforms]]
dockerfile = "src/runtime-deps/arm64v8/Dockerfile"
architecture = "arm64"
tags = ["8.0-arm64v8"]

[[repos]]
name = "dotnet/runtime"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "src/runtime/Dockerfile"
tags = ["8.0"]
overridden-base-images = ["dotnet/runtime-deps:8.0"]
)";

void writeProject(const tests::TempDir& tmp) {
  tests::writeFile(tmp / "imgbuild.toml", MANIFEST);
  tests::writeFile(tmp / "src/runtime-deps/Dockerfile", "FROM debian:bookworm\n");
  tests::writeFile(tmp / "src/runtime-deps/arm64v8/Dockerfile",
                   "FROM arm64v8/debian:bookworm\n");
  tests::writeFile(tmp / "src/runtime/Dockerfile",
                   "FROM dotnet/runtime-deps:8.0\n");
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "imgbuild build --dry-run reports every phase"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto result =
        tests::runImgbuild({ "build", "--dry-run", "--push" }, tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(tests::contains(result.err, "PULLING BASE IMAGES"));
    expect(tests::contains(result.err, "docker pull --platform linux/amd64 "
                                       "debian:bookworm"))
        << result.err;
    expect(tests::contains(result.err, "BUILDING IMAGES"));
    expect(tests::contains(result.err, "PUSHING IMAGES"));
    expect(tests::contains(result.err, "IMAGES BUILT"));
    expect(tests::contains(result.err,
                           "mcr.example.com/dotnet/runtime-deps:8.0-local"));
    expect(!tests::contains(result.err,
                            "docker push mcr.example.com/dotnet/runtime-deps:"
                            "8.0-local"));
    expect(tests::contains(result.err, "Replacing FROM "
                                       "`dotnet/runtime-deps:8.0` with "
                                       "`mcr.example.com/dotnet/runtime-deps:"
                                       "8.0`"))
        << result.err;
    expect(!tests::fs::exists(tmp / "src/runtime/Dockerfile.temp"));
  };

  "imgbuild build filters by architecture"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto result =
        tests::runImgbuild({ "build", "--dry-run", "--skip-pulling",
                             "--architecture", "arm64" },
                           tmp.path)
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(!tests::contains(result.err, "PULLING BASE IMAGES"));
    expect(tests::contains(result.err,
                           "mcr.example.com/dotnet/runtime-deps:8.0-arm64v8"));
    expect(!tests::contains(result.err,
                            "mcr.example.com/dotnet/runtime-deps:8.0-amd64"));
    expect(!tests::contains(result.err, "PUSHING IMAGES"));
  };

  "imgbuild build reports an empty selection"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto result = tests::runImgbuild({ "build", "--dry-run", "--push",
                                             "--os-type", "windows" },
                                           tmp.path)
                            .unwrap();
    expect(result.status.success()) << result.err;
    expect(tests::contains(result.err, "No images built"));
    expect(!tests::contains(result.err, "PUSHING IMAGES"));
  };

  "imgbuild build rejects unknown repo overrides"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto result =
        tests::runImgbuild({ "build", "--dry-run", "--repo-override",
                             "dotnet/sdk=mirror/sdk" },
                           tmp.path)
            .unwrap();
    expect(!result.status.success());
    expect(tests::contains(result.err,
                           "Error: unknown repo `dotnet/sdk` in repo override"))
        << result.err;
  };

  "imgbuild build finds the manifest from a subdirectory"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto result =
        tests::runImgbuild({ "build", "--dry-run", "--skip-pulling" },
                           tmp / "src/runtime")
            .unwrap();
    expect(result.status.success()) << result.err;
    expect(tests::contains(result.err, "mcr.example.com/dotnet/runtime:8.0"));
  };

  "imgbuild build rejects unknown options"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto result =
        tests::runImgbuild({ "build", "--bogus" }, tmp.path).unwrap();
    expect(!result.status.success());
    expect(tests::contains(result.err, "unexpected argument '--bogus' found"))
        << result.err;
  };

  "imgbuild build bounds the retry policy"_test = [] {
    const tests::TempDir tmp;
    writeProject(tmp);

    const auto hugeDelay = tests::runImgbuild(
                               { "build", "--dry-run", "--retry-delay-ms",
                                 "18446744073709551615" },
                               tmp.path)
                               .unwrap();
    expect(!hugeDelay.status.success());
    expect(tests::contains(hugeDelay.err,
                           "`--retry-delay-ms` must be at most 600000"))
        << hugeDelay.err;

    const auto tooManyAttempts =
        tests::runImgbuild(
            { "build", "--dry-run", "--retry-attempts", "101" }, tmp.path)
            .unwrap();
    expect(!tooManyAttempts.status.success());
    expect(tests::contains(tooManyAttempts.err,
                           "`--retry-attempts` must be between 1 and 100"))
        << tooManyAttempts.err;

    const auto withinBounds =
        tests::runImgbuild({ "build", "--dry-run", "--skip-pulling",
                             "--retry-attempts", "100", "--retry-delay-ms",
                             "600000" },
                           tmp.path)
            .unwrap();
    expect(withinBounds.status.success()) << withinBounds.err;
  };
}
