#include <lina/formatter.hpp>

#include <catch2/catch.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace lina;

static std::unique_ptr<formatter>
make(const std::string& name, std::optional<std::string> argument = {}) {
  const auto* factory = formatter_registry::builtin().find(name);
  REQUIRE(factory != nullptr);
  return (*factory)(argument);
}

static std::string
format_with(const std::string& name, const value& input,
            std::optional<std::string> argument = {}) {
  return to_string(make(name, std::move(argument))->format(input));
}

TEST_CASE("builtin registry names", "[formatter]") {
  const auto& registry = formatter_registry::builtin();
  for (const char* name :
       {"width", "w", "prefix", "suffix", "default", "upper-case", "uc",
        "escape-newlines", "escape-string", "wrap-string", "cbool", "hex",
        "indent", "list-separator", "separator", "l-s"})
    CHECK(registry.contains(name));
  CHECK(registry.size() == 16);
  CHECK_FALSE(registry.contains("foo"));
  CHECK(registry.find("foo") == nullptr);
}

TEST_CASE("formatter kinds", "[formatter]") {
  CHECK(make("width", "3")->is_value_formatter());
  CHECK(make("hex")->is_value_formatter());
  CHECK(make("indent", "1")->is_block_formatter());
  CHECK(make("l-s", ",")->is_block_formatter());
}

TEST_CASE("width pads to the requested length", "[formatter]") {
  CHECK(format_with("width", 42, "-4") == "  42");
  CHECK(format_with("width", 42, "4") == "42  ");
  CHECK(format_with("w", "toolong", "3") == "toolong");
  CHECK(format_with("width", "\xc3\xa4", "3") == "\xc3\xa4  ");
}

TEST_CASE("prefix and suffix", "[formatter]") {
  CHECK(format_with("prefix", "b", "a") == "ab");
  CHECK(format_with("suffix", "b", "a") == "ba");
  CHECK(format_with("prefix", 1, "#") == "#1");
}

TEST_CASE("default replaces null only", "[formatter]") {
  CHECK(format_with("default", value(), "def") == "def");
  CHECK(format_with("default", "bla", "def") == "bla");
  CHECK(format_with("default", "", "def") == "");
}

TEST_CASE("upper-case", "[formatter]") {
  CHECK(format_with("upper-case", "baD") == "BAD");
  CHECK(format_with("uc", "a1-b") == "A1-B");
}

TEST_CASE("escaping formatters", "[formatter]") {
  CHECK(format_with("escape-newlines", "\n") == "\\n");
  CHECK(format_with("escape-newlines", "a\nb\n") == "a\\nb\\n");
  CHECK(format_with("escape-string", "say \"hi\"\n\t") ==
        "say \\\"hi\\\"\\n\\t");
}

TEST_CASE("wrap-string quotes strings only", "[formatter]") {
  CHECK(format_with("wrap-string", "Some string") == "\"Some string\"");
  CHECK(format_with("wrap-string", 256) == "256");
}

TEST_CASE("cbool lowercases booleans only", "[formatter]") {
  CHECK(format_with("cbool", true) == "true");
  CHECK(format_with("cbool", false) == "false");
  CHECK(format_with("cbool", 1) == "1");
}

TEST_CASE("hex", "[formatter]") {
  CHECK(format_with("hex", 127) == "0x7F");
  CHECK(format_with("hex", 0) == "0x0");
  CHECK(format_with("hex", -255) == "-0xFF");
  CHECK(format_with("hex", "4096") == "0x1000");
  CHECK_THROWS_AS(format_with("hex", "abc"), std::invalid_argument);
  CHECK_THROWS_AS(format_with("hex", 1.5), std::invalid_argument);
}

TEST_CASE("indent hooks", "[formatter]") {
  auto f = make("indent", "2");
  CHECK(f->on_block_begin(true) == "\t\t");
  CHECK(f->on_block_begin(false) == "\t\t");
  CHECK(f->on_block_end(true) == "");
  CHECK(f->format_block("a\nb") == "a\n\t\tb");
}

TEST_CASE("list-separator hooks", "[formatter]") {
  auto f = make("list-separator", ", ");
  CHECK(f->on_block_begin(true) == "");
  CHECK(f->on_block_end(false) == ", ");
  CHECK(f->on_block_end(true) == "");

  CHECK(make("separator", "NEWLINE")->on_block_end(false) == "\n");
  CHECK(make("l-s", "SPACE|SPACE")->on_block_end(false) == " | ");
}

TEST_CASE("argument validation", "[formatter]") {
  CHECK_THROWS_AS(make("width"), std::invalid_argument);
  CHECK_THROWS_AS(make("width", "wide"), std::invalid_argument);
  CHECK_THROWS_AS(make("indent", "2x"), std::invalid_argument);
  CHECK_THROWS_AS(make("prefix"), std::invalid_argument);
  CHECK_THROWS_AS(make("hex", "16"), std::invalid_argument);
  CHECK(make("width", "+3")->format("a") == value("a  "));
  CHECK_THROWS_AS(make("width", "4294967297"), std::invalid_argument);
  CHECK_THROWS_AS(make("width", "-2147483648"), std::invalid_argument);
  CHECK_THROWS_AS(make("indent", "65536"), std::invalid_argument);
  CHECK(make("width", "-65535") != nullptr);
}

namespace {

  class reverse_formatter : public formatter {
  public:
    formatter_kind
    kind() const override {
      return formatter_kind::value;
    }

    value
    format(const value& input) const override {
      std::string text = to_string(input);
      return std::string(text.rbegin(), text.rend());
    }
  };

} // namespace

TEST_CASE("registries can be extended", "[formatter]") {
  auto registry = formatter_registry::defaults();
  registry.set("reverse", [](const std::optional<std::string>&) {
    return std::make_unique<reverse_formatter>();
  });

  CHECK(registry.contains("reverse"));
  CHECK(registry.contains("hex"));
  CHECK_FALSE(formatter_registry::builtin().contains("reverse"));

  auto f = (*registry.find("reverse"))(std::nullopt);
  CHECK(to_string(f->format("abc")) == "cba");
}
