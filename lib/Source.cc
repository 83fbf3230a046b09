#include "Source.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace cargoidx {

static constexpr std::string_view CRATES_IO_REGISTRY =
    "registry+https://github.com/rust-lang/crates.io-index";
static constexpr std::string_view CRATES_IO_SPARSE =
    "sparse+https://index.crates.io/";

Source Source::parse(std::string repr) {
  const std::string_view str = repr;
  Kind kind = Kind::Unrecognized;
  if (str == CRATES_IO_REGISTRY || str == CRATES_IO_SPARSE) {
    kind = Kind::CratesIo;
  } else if (str.starts_with("registry+") || str.starts_with("sparse+")) {
    kind = Kind::Registry;
  } else if (str.starts_with("git+")) {
    kind = Kind::Git;
  } else if (str.starts_with("path+")) {
    kind = Kind::Local;
  }
  return { kind, std::move(repr) };
}

} // namespace cargoidx

#ifdef CARGOIDX_TEST

#  include <rs/tests.hpp>

// NOLINTBEGIN
using namespace cargoidx;
// NOLINTEND

static void testClassify() {
  rs::assertTrue(Source::parse(std::string(CRATES_IO_REGISTRY)).kind()
                 == Source::Kind::CratesIo);
  rs::assertTrue(Source::parse(std::string(CRATES_IO_SPARSE)).kind()
                 == Source::Kind::CratesIo);
  rs::assertTrue(Source::parse("git+https://github.com/serde-rs/serde#0123abcd")
                     .kind()
                 == Source::Kind::Git);
  rs::assertTrue(Source::parse("registry+https://example.com/index").kind()
                 == Source::Kind::Registry);
  rs::assertTrue(Source::parse("path+file:///work/foo").kind()
                 == Source::Kind::Local);
  rs::assertTrue(Source::parse("svn://example.com").kind()
                 == Source::Kind::Unrecognized);

  rs::pass();
}

static void testOrdering() {
  const Source lhs = Source::parse("git+https://a.example/x#1");
  const Source rhs = Source::parse("git+https://b.example/x#1");
  rs::assertTrue(lhs < rhs);
  rs::assertTrue(lhs == Source::parse("git+https://a.example/x#1"));

  rs::pass();
}

int main() {
  testClassify();
  testOrdering();
}

#endif
