#include "Platform.hpp"

#include <cctype>
#include <cstddef>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cargoidx {

PlatformPredicate PlatformPredicate::flag(std::string key) {
  return { Kind::Bool, std::move(key), {}, {} };
}

PlatformPredicate PlatformPredicate::value(std::string key,
                                           std::string value) {
  return { Kind::Value, std::move(key), std::move(value), {} };
}

PlatformPredicate PlatformPredicate::negate(PlatformPredicate pred) {
  std::vector<PlatformPredicate> children;
  children.push_back(std::move(pred));
  return { Kind::Not, {}, {}, std::move(children) };
}

PlatformPredicate PlatformPredicate::all(std::vector<PlatformPredicate> preds) {
  return { Kind::All, {}, {}, std::move(preds) };
}

PlatformPredicate PlatformPredicate::any(std::vector<PlatformPredicate> preds) {
  return { Kind::Any, {}, {}, std::move(preds) };
}

std::string PlatformPredicate::toString() const {
  switch (kind_) {
  case Kind::Bool:
    return key_;
  case Kind::Value:
    return fmt::format("{} = \"{}\"", key_, value_);
  case Kind::Not:
    return fmt::format("not({})", children_.front());
  case Kind::All:
    return fmt::format("all({})", fmt::join(children_, ", "));
  case Kind::Any:
    return fmt::format("any({})", fmt::join(children_, ", "));
  }
  __builtin_unreachable();
}

PlatformExpr PlatformPredicate::toExpr() const {
  return fmt::format("cfg({})", toString());
}

namespace {

class CfgParser {
public:
  explicit CfgParser(std::string_view input) : input(input) {}

  rs::Result<PlatformPredicate> parseAll() {
    PlatformPredicate pred = rs_try(parseExpr());
    skipWs();
    rs_ensure(pos == input.size(), "unexpected `{}` at offset {}",
              input.substr(pos), pos);
    return rs::Ok(std::move(pred));
  }

private:
  std::string_view input;
  std::size_t pos = 0;

  void skipWs() {
    while (pos < input.size()
           && std::isspace(static_cast<unsigned char>(input[pos]))) {
      ++pos;
    }
  }

  bool consume(const char c) {
    skipWs();
    if (pos < input.size() && input[pos] == c) {
      ++pos;
      return true;
    }
    return false;
  }

  rs::Result<std::string> parseIdent() {
    skipWs();
    const std::size_t start = pos;
    if (pos < input.size()
        && (std::isalpha(static_cast<unsigned char>(input[pos]))
            || input[pos] == '_')) {
      ++pos;
      while (pos < input.size()
             && (std::isalnum(static_cast<unsigned char>(input[pos]))
                 || input[pos] == '_')) {
        ++pos;
      }
    }
    rs_ensure(start != pos, "expected identifier at offset {}", start);
    return rs::Ok(std::string(input.substr(start, pos - start)));
  }

  rs::Result<std::string> parseString() {
    rs_ensure(consume('"'), "expected string at offset {}", pos);
    const std::size_t start = pos;
    const std::size_t end = input.find('"', start);
    rs_ensure(end != std::string_view::npos,
              "unterminated string starting at offset {}", start - 1);
    pos = end + 1;
    return rs::Ok(std::string(input.substr(start, end - start)));
  }

  rs::Result<std::vector<PlatformPredicate>> parseList() {
    std::vector<PlatformPredicate> preds;
    while (!consume(')')) {
      preds.push_back(rs_try(parseExpr()));
      if (consume(',')) {
        continue;
      }
      rs_ensure(consume(')'), "expected `,` or `)` at offset {}", pos);
      break;
    }
    return rs::Ok(std::move(preds));
  }

  rs::Result<PlatformPredicate> parseExpr() { // NOLINT(misc-no-recursion)
    std::string ident = rs_try(parseIdent());

    if (consume('=')) {
      std::string value = rs_try(parseString());
      return rs::Ok(PlatformPredicate::value(std::move(ident),
                                             std::move(value)));
    }
    if (!consume('(')) {
      return rs::Ok(PlatformPredicate::flag(std::move(ident)));
    }

    std::vector<PlatformPredicate> preds = rs_try(parseList());
    if (ident == "all") {
      return rs::Ok(PlatformPredicate::all(std::move(preds)));
    } else if (ident == "any") {
      return rs::Ok(PlatformPredicate::any(std::move(preds)));
    } else if (ident == "not") {
      rs_ensure(preds.size() == 1, "not() takes exactly one predicate, got {}",
                preds.size());
      return rs::Ok(PlatformPredicate::negate(std::move(preds.front())));
    }
    rs_bail("unknown operator `{}`", ident);
  }
};

bool isTripleChar(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_'
         || c == '.';
}

} // namespace

rs::Result<PlatformPredicate> PlatformPredicate::parse(std::string_view input) {
  while (!input.empty()
         && std::isspace(static_cast<unsigned char>(input.front()))) {
    input.remove_prefix(1);
  }
  while (!input.empty()
         && std::isspace(static_cast<unsigned char>(input.back()))) {
    input.remove_suffix(1);
  }
  rs_ensure(!input.empty(), "empty platform predicate");

  if (input.starts_with("cfg(")) {
    rs_ensure(input.ends_with(")"), "invalid platform predicate `{}`: {}",
              input, "missing closing `)`");

    const std::string_view inner = input.substr(4, input.size() - 5);
    auto pred = CfgParser(inner).parseAll();
    if (pred.is_err()) {
      rs_bail("invalid platform predicate `{}`: {}", input,
              pred.unwrap_err()->what());
    }
    return rs::Ok(std::move(pred).unwrap());
  }

  for (const char c : input) {
    rs_ensure(isTripleChar(c), "invalid platform predicate `{}`: {}", input,
              "not a cfg expression or target triple");
  }
  return rs::Ok(PlatformPredicate::value("target", std::string(input)));
}

} // namespace cargoidx

#ifdef CARGOIDX_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace cargoidx;
// NOLINTEND

static void testParseFlag() {
  rs::assertEq(PlatformPredicate::parse("cfg(windows)").unwrap(),
               PlatformPredicate::flag("windows"));
  rs::assertEq(PlatformPredicate::parse("  cfg( unix )  ").unwrap().toExpr(),
               "cfg(unix)");

  rs::pass();
}

static void testParseValue() {
  const auto pred =
      PlatformPredicate::parse(R"(cfg(target_os = "linux"))").unwrap();
  rs::assertEq(pred, PlatformPredicate::value("target_os", "linux"));
  rs::assertEq(pred.toString(), R"(target_os = "linux")");

  rs::pass();
}

static void testParseNested() {
  const auto pred = PlatformPredicate::parse(
                        R"(cfg(all(unix, not(target_os="macos"), any(a, b,))))")
                        .unwrap();
  rs::assertEq(pred.toString(),
               R"(all(unix, not(target_os = "macos"), any(a, b)))");
  rs::assertTrue(pred.kind() == PlatformPredicate::Kind::All);
  rs::assertEq(pred.children().size(), 3UL);

  rs::pass();
}

static void testParseTriple() {
  rs::assertEq(PlatformPredicate::parse("x86_64-pc-windows-msvc")
                   .unwrap()
                   .toExpr(),
               R"(cfg(target = "x86_64-pc-windows-msvc"))");

  rs::pass();
}

static void testParseErrors() {
  rs::assertEq(rs::errMsg(PlatformPredicate::parse("")),
               "empty platform predicate");
  rs::assertEq(rs::errMsg(PlatformPredicate::parse("cfg(windows")),
               "invalid platform predicate `cfg(windows`: missing closing `)`");
  rs::assertEq(rs::errMsg(PlatformPredicate::parse("cfg(not(a, b))")),
               "invalid platform predicate `cfg(not(a, b))`: not() takes "
               "exactly one predicate, got 2");
  rs::assertEq(rs::errMsg(PlatformPredicate::parse("cfg(xor(a))")),
               "invalid platform predicate `cfg(xor(a))`: unknown operator "
               "`xor`");
  rs::assertEq(rs::errMsg(PlatformPredicate::parse(R"(cfg(os = "x)")),
               R"(invalid platform predicate `cfg(os = "x)`: unterminated )"
               "string starting at offset 5");
  rs::assertEq(rs::errMsg(PlatformPredicate::parse("cfg(a b)")),
               "invalid platform predicate `cfg(a b)`: unexpected `b` at "
               "offset 2");
  rs::assertEq(rs::errMsg(PlatformPredicate::parse("windows && unix")),
               "invalid platform predicate `windows && unix`: not a cfg "
               "expression or target triple");

  rs::pass();
}

static void testNonAscii() {
  rs::assertTrue(PlatformPredicate::parse("cfg(\xe4\xb8\x80)").is_err());
  rs::assertTrue(PlatformPredicate::parse("x86_64-\xff-linux").is_err());
  rs::assertTrue(PlatformPredicate::parse("\xa0" "cfg(unix)").is_err());
  rs::assertTrue(PlatformPredicate::parse("cfg(a = \"\xc3\xa9\")").is_ok());

  rs::pass();
}

static void testAny() {
  const auto pred = PlatformPredicate::any(
      { PlatformPredicate::flag("windows"), PlatformPredicate::flag("unix") });
  rs::assertEq(pred.toExpr(), "cfg(any(windows, unix))");

  rs::pass();
}

int main() {
  testParseFlag();
  testParseValue();
  testParseNested();
  testParseTriple();
  testParseErrors();
  testNonAscii();
  testAny();
}

#endif
