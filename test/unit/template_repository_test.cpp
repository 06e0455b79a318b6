#include <lina/template_repository.hpp>

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using namespace lina;

namespace fs = std::filesystem;

static transport_fn
make_mock_transport(const std::unordered_map<std::string, std::string>& files,
                    std::vector<std::string>* requested = nullptr) {
  return [files, requested](const std::string& location) -> std::string {
    if (requested != nullptr) requested->push_back(location);
    auto it = files.find(location);
    if (it == files.end()) throw std::runtime_error("not found: " + location);
    return it->second;
  };
}

TEST_CASE("location_of joins location, name and suffix",
          "[template_repository]") {
  CHECK(template_repository("dir").location_of("a") == "dir/a");
  CHECK(template_repository("dir/", ".lina").location_of("a") == "dir/a.lina");
  CHECK(template_repository("", ".lina").location_of("a") == "a.lina");
  CHECK(template_repository("https://example.com/t", ".lina")
            .location_of("header") == "https://example.com/t/header.lina");
}

TEST_CASE("get loads through the transport", "[template_repository]") {
  std::vector<std::string> requested;
  template_repository repo(
      "tpl", ".lina",
      make_mock_transport({{"tpl/greeting.lina", "Hello {{name}}"}},
                          &requested));

  text_template t = repo.get("greeting");
  CHECK(t.source() == "Hello {{name}}");
  CHECK(t.options().filename == "greeting");
  CHECK(t.options().includes == &repo);
  CHECK(t.render_simple({{"name", "World"}}) == "Hello World");
  REQUIRE(requested.size() == 1);
  CHECK(requested[0] == "tpl/greeting.lina");
}

TEST_CASE("included templates resolve their own includes",
          "[template_repository]") {
  template_repository repo(
      "t", {},
      make_mock_transport({
          {"t/outer", "<{{>middle}}>"},
          {"t/middle", "[{{>inner}}]"},
          {"t/inner", "{{value}}"},
      }));

  text_template root("{{>outer}}", &repo);
  CHECK(root.render_simple({{"value", 7}}) == "<[7]>");
}

TEST_CASE("transport failures propagate", "[template_repository]") {
  template_repository repo("t", {}, make_mock_transport({}));
  text_template root("{{>missing}}", &repo);
  CHECK_THROWS_AS(root.render_simple(), std::runtime_error);
}

TEST_CASE("repository settings apply to loaded templates",
          "[template_repository]") {
  std::vector<std::string> warnings;
  auto registry = formatter_registry::defaults();

  template_repository repo("t", {},
                           make_mock_transport({{"t/part", "{{x}}"}}));
  repo.set_formatters(&registry);
  repo.set_warning_handler(
      [&](const std::string& message, const source_position& position) {
        warnings.push_back(to_string(position) + " " + message);
      });

  text_template part = repo.get("part");
  CHECK(part.options().formatters == &registry);
  CHECK(part.render_simple({{"x", nullptr}}) == "");
  REQUIRE(warnings.size() == 1);
  CHECK(warnings[0].starts_with("part:1:1 "));
}

namespace {

  class shout_formatter : public formatter {
  public:
    formatter_kind
    kind() const override {
      return formatter_kind::value;
    }

    value
    format(const value& input) const override {
      return to_string(input) + "!";
    }
  };

} // namespace

TEST_CASE("included templates use the repository registry",
          "[template_repository]") {
  auto registry = formatter_registry::defaults();
  registry.set("shout", [](const std::optional<std::string>&) {
    return std::make_unique<shout_formatter>();
  });

  template_repository repo("t", {},
                           make_mock_transport({{"t/part", "{{x:shout}}"}}));

  template_options options;
  options.includes = &repo;
  options.formatters = &registry;
  text_template root("{{x:shout}}{{>part}}", options);

  CHECK_THROWS_AS(root.render_simple({{"x", "a"}}), invalid_formatter);

  repo.set_formatters(&registry);
  CHECK(root.render_simple({{"x", "a"}}) == "a!a!");
}

TEST_CASE("read_local_file", "[template_repository]") {
  auto dir = fs::temp_directory_path() / "lina_repository_test";
  fs::create_directories(dir);
  {
    std::ofstream out(dir / "body.lina");
    out << "file {{x}}";
  }

  CHECK(read_local_file((dir / "body.lina").string()) == "file {{x}}");
  CHECK_THROWS_AS(read_local_file((dir / "missing.lina").string()),
                  std::runtime_error);

  template_repository repo(dir.string(), ".lina");
  CHECK(repo.get("body").render_simple({{"x", 1}}) == "file 1");

  fs::remove_all(dir);
}
