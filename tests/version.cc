#include "helpers.hpp"

#include <boost/ut.hpp>
#include <regex>
#include <string>

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "imgbuild binary is executable"_test = [] {
    const auto bin = tests::imgbuildBinary();
    expect(tests::fs::exists(bin)) << bin.string();
    const auto perms = tests::fs::status(bin).permissions();
    expect((perms & tests::fs::perms::owner_exec) != tests::fs::perms::none);
  };

  "imgbuild version"_test = [] {
    const auto result = tests::runImgbuild({ "version" }).unwrap();
    expect(result.status.success());

    static const std::regex pattern(R"(^imgbuild [0-9]+\.[0-9]+\.[0-9]+\n$)");
    expect(std::regex_match(result.out, pattern)) << result.out;
    expect(result.err.empty()) << result.err;
  };

  "imgbuild --version matches version"_test = [] {
    const auto longFlag = tests::runImgbuild({ "--version" }).unwrap();
    const auto subcmd = tests::runImgbuild({ "version" }).unwrap();
    expect(longFlag.status.success());
    expect(longFlag.out == subcmd.out);
  };

  "imgbuild version rejects arguments"_test = [] {
    const auto result = tests::runImgbuild({ "version", "--push" }).unwrap();
    expect(!result.status.success());
    expect(tests::contains(result.err, "unexpected argument '--push' found"))
        << result.err;
  };
}
