#include "Semver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace cargoidx {

std::string VersionIdent::toString() const {
  if (isNumeric()) {
    return std::to_string(std::get<std::uint64_t>(ident));
  }
  return std::get<std::string>(ident);
}

// Numeric identifiers always have lower precedence than alphanumeric ones.
std::strong_ordering
VersionIdent::operator<=>(const VersionIdent& other) const {
  if (isNumeric() && other.isNumeric()) {
    return std::get<std::uint64_t>(ident)
           <=> std::get<std::uint64_t>(other.ident);
  }
  if (isNumeric()) {
    return std::strong_ordering::less;
  }
  if (other.isNumeric()) {
    return std::strong_ordering::greater;
  }
  return std::get<std::string>(ident).compare(std::get<std::string>(other.ident))
         <=> 0;
}

static std::string joinIdents(const std::vector<VersionIdent>& idents) {
  std::string str;
  for (std::size_t i = 0; i < idents.size(); ++i) {
    if (i > 0) {
      str += '.';
    }
    str += idents[i].toString();
  }
  return str;
}

std::string Prerelease::toString() const { return joinIdents(ident); }

std::strong_ordering Prerelease::operator<=>(const Prerelease& other) const {
  if (empty() && other.empty()) {
    return std::strong_ordering::equal;
  }
  if (empty()) {
    return std::strong_ordering::greater;
  }
  if (other.empty()) {
    return std::strong_ordering::less;
  }
  return std::lexicographical_compare_three_way(
      ident.begin(), ident.end(), other.ident.begin(), other.ident.end());
}

std::string BuildMetadata::toString() const { return joinIdents(ident); }

std::strong_ordering
BuildMetadata::operator<=>(const BuildMetadata& other) const {
  return std::lexicographical_compare_three_way(
      ident.begin(), ident.end(), other.ident.begin(), other.ident.end());
}

std::strong_ordering Version::operator<=>(const Version& other) const {
  if (const auto cmp = major <=> other.major; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = minor <=> other.minor; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = patch <=> other.patch; cmp != 0) {
    return cmp;
  }
  if (const auto cmp = pre <=> other.pre; cmp != 0) {
    return cmp;
  }
  return build <=> other.build;
}

std::string Version::toString() const {
  std::string str = fmt::format("{}.{}.{}", major, minor, patch);
  if (!pre.empty()) {
    str += '-';
    str += pre.toString();
  }
  if (!build.empty()) {
    str += '+';
    str += build.toString();
  }
  return str;
}

namespace {

class VersionParser {
public:
  explicit VersionParser(std::string_view str) : str(str) {}

  rs::Result<Version> parse() {
    Version version;
    version.major = rs_try(parseNum());
    rs_try(expect('.'));
    version.minor = rs_try(parseNum());
    rs_try(expect('.'));
    version.patch = rs_try(parseNum());

    if (pos < str.size() && str[pos] == '-') {
      ++pos;
      version.pre.ident = rs_try(parseIdents(/*isPre=*/true));
    }
    if (pos < str.size() && str[pos] == '+') {
      ++pos;
      version.build.ident = rs_try(parseIdents(/*isPre=*/false));
    }
    if (pos < str.size()) {
      rs_bail("{}", diag(pos, str.size() - pos, "unexpected character"));
    }
    return rs::Ok(std::move(version));
  }

private:
  std::string_view str;
  std::size_t pos = 0;

  std::string diag(const std::size_t at, const std::size_t len,
                   const std::string_view msg) const {
    return fmt::format("invalid semver:\n{}\n{}{} {}", str,
                       std::string(at, ' '),
                       std::string(std::max<std::size_t>(len, 1), '^'), msg);
  }

  std::size_t tokenLen() const {
    std::size_t len = 0;
    while (pos + len < str.size() && str[pos + len] != '.'
           && str[pos + len] != '-' && str[pos + len] != '+') {
      ++len;
    }
    return len;
  }

  rs::Result<void> expect(const char c) {
    if (pos >= str.size() || str[pos] != c) {
      rs_bail("{}", diag(pos, 1, fmt::format("expected `{}`", c)));
    }
    ++pos;
    return rs::Ok();
  }

  rs::Result<std::uint64_t> parseNum() {
    const std::size_t start = pos;
    while (pos < str.size()
           && std::isdigit(static_cast<unsigned char>(str[pos]))) {
      ++pos;
    }
    if (start == pos) {
      rs_bail("{}", diag(start, tokenLen(), "expected number"));
    }
    if (str[start] == '0' && pos - start > 1) {
      rs_bail("{}", diag(start, pos - start, "invalid leading zero"));
    }

    std::uint64_t num{};
    const auto [ptr, ec] =
        std::from_chars(str.data() + start, str.data() + pos, num);
    if (ec != std::errc()) {
      rs_bail("{}", diag(start, pos - start, "number exceeds UINT64_MAX"));
    }
    return rs::Ok(num);
  }

  rs::Result<std::vector<VersionIdent>> parseIdents(const bool isPre) {
    std::vector<VersionIdent> idents;
    while (true) {
      const std::size_t start = pos;
      bool allDigits = true;
      while (pos < str.size()
             && (std::isalnum(static_cast<unsigned char>(str[pos]))
                 || str[pos] == '-')) {
        allDigits = allDigits
                  && std::isdigit(static_cast<unsigned char>(str[pos]));
        ++pos;
      }
      if (start == pos) {
        rs_bail("{}", diag(start, 1, "expected identifier"));
      }

      const std::string_view tok = str.substr(start, pos - start);
      if (isPre && allDigits) {
        if (tok.size() > 1 && tok.front() == '0') {
          rs_bail("{}", diag(start, tok.size(), "invalid leading zero"));
        }
        std::uint64_t num{};
        const auto [ptr, ec] =
            std::from_chars(tok.data(), tok.data() + tok.size(), num);
        if (ec != std::errc()) {
          rs_bail("{}", diag(start, tok.size(), "number exceeds UINT64_MAX"));
        }
        idents.push_back(VersionIdent{ num });
      } else {
        idents.push_back(VersionIdent{ std::string(tok) });
      }

      if (pos < str.size() && str[pos] == '.') {
        ++pos;
        continue;
      }
      break;
    }
    return rs::Ok(std::move(idents));
  }
};

} // namespace

rs::Result<Version> Version::parse(const std::string_view str) {
  return VersionParser(str).parse();
}

} // namespace cargoidx

#ifdef CARGOIDX_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace cargoidx;
// NOLINTEND

static void testParse() {
  const Version ver = Version::parse("1.2.3-alpha.1+build.5").unwrap();
  rs::assertEq(ver.major, 1UL);
  rs::assertEq(ver.minor, 2UL);
  rs::assertEq(ver.patch, 3UL);
  rs::assertEq(ver.pre.toString(), "alpha.1");
  rs::assertEq(ver.build.toString(), "build.5");
  rs::assertEq(ver.toString(), "1.2.3-alpha.1+build.5");

  rs::assertEq(Version::parse("0.0.0").unwrap().toString(), "0.0.0");

  rs::pass();
}

static void testParseErrors() {
  rs::assertEq(rs::errMsg(Version::parse("invalid")), R"(invalid semver:
invalid
^^^^^^^ expected number)");
  rs::assertEq(rs::errMsg(Version::parse("1.2")), R"(invalid semver:
1.2
   ^ expected `.`)");
  rs::assertEq(rs::errMsg(Version::parse("01.2.3")), R"(invalid semver:
01.2.3
^^ invalid leading zero)");
  rs::assertEq(rs::errMsg(Version::parse("1.2.3-")), R"(invalid semver:
1.2.3-
      ^ expected identifier)");
  rs::assertTrue(Version::parse("1.2.3-\xc3\xa9").is_err());
  rs::assertTrue(Version::parse("\xff.2.3").is_err());
  rs::assertEq(rs::errMsg(Version::parse("1.2.3x")), R"(invalid semver:
1.2.3x
     ^ unexpected character)");

  rs::pass();
}

static void testOrdering() {
  const auto v = [](const std::string_view str) {
    return Version::parse(str).unwrap();
  };

  rs::assertTrue(v("1.0.0-alpha") < v("1.0.0-alpha.1"));
  rs::assertTrue(v("1.0.0-alpha.1") < v("1.0.0-alpha.beta"));
  rs::assertTrue(v("1.0.0-alpha.beta") < v("1.0.0-beta"));
  rs::assertTrue(v("1.0.0-beta.2") < v("1.0.0-beta.11"));
  rs::assertTrue(v("1.0.0-rc.1") < v("1.0.0"));
  rs::assertTrue(v("1.0.0") < v("1.0.1"));
  rs::assertTrue(v("0.9.10") < v("0.10.0"));
  rs::assertTrue(v("1.0.0") < v("1.0.0+build"));
  rs::assertTrue(v("1.0.0+build") == v("1.0.0+build"));
  rs::assertFalse(v("1.0.0+a") == v("1.0.0+b"));

  rs::pass();
}

int main() {
  testParse();
  testParseErrors();
  testOrdering();
}

#endif
