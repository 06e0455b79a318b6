#include <lina/error.hpp>
#include <lina/json_context.hpp>
#include <lina/template_repository.hpp>
#include <lina/text_template.hpp>
#include <lina/xml_context.hpp>

#ifdef LINA_HAS_CURL
#include <curl/curl.h>
#endif

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_template = 4;

struct cli_options {
  std::string template_file;
  std::string context_file;
  std::vector<std::pair<std::string, std::string>> defines;
  std::string include_location;
  std::string include_suffix;
  std::string output_file;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: lina [options] <template>\n"
     << "\n"
     << "Options:\n"
     << "  -c <file>         Context file (.json or .xml)\n"
     << "  -D <name=value>   Define a string variable in the root context\n"
     << "  -I <dir|url>      Location of included templates (default: the\n"
     << "                    template's directory)\n"
     << "  -s <suffix>       Suffix appended to included template names\n"
     << "  -o <file>         Output file (default: stdout)\n"
     << "  -q                Suppress warnings\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "lina " << LINA_VERSION << "\n";
}

static std::string
require_value(int argc, char* argv[], int& i, const std::string& option) {
  if (i + 1 >= argc) {
    std::cerr << "lina: " << option << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-q") {
      opts.quiet = true;
      continue;
    }

    if (arg == "-c") {
      opts.context_file = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "-D") {
      std::string define = require_value(argc, argv, i, arg);
      auto eq = define.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "lina: -D argument must be name=value\n";
        std::exit(exit_usage);
      }
      opts.defines.emplace_back(define.substr(0, eq), define.substr(eq + 1));
      continue;
    }

    if (arg == "-I") {
      opts.include_location = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "-s") {
      opts.include_suffix = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg == "-o") {
      opts.output_file = require_value(argc, argv, i, arg);
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "lina: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.template_file.empty()) {
      std::cerr << "lina: only one template may be given\n";
      std::exit(exit_usage);
    }
    opts.template_file = arg;
  }

  return opts;
}

static bool
is_http_url(const std::string& s) {
  return s.starts_with("http://") || s.starts_with("https://");
}

static bool
has_extension(const std::string& path, const std::string& ext) {
  if (path.size() < ext.size()) return false;
  auto suffix = path.substr(path.size() - ext.size());
  for (std::size_t i = 0; i < ext.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(suffix[i])) !=
        std::tolower(static_cast<unsigned char>(ext[i])))
      return false;
  }
  return true;
}

#ifdef LINA_HAS_CURL
static std::size_t
lina_curl_write_cb(char* ptr, std::size_t size, std::size_t nmemb,
                   void* userdata) {
  auto* buf = static_cast<std::string*>(userdata);
  buf->append(ptr, size * nmemb);
  return size * nmemb;
}

static std::string
curl_fetch(const std::string& url) {
  CURL* curl = curl_easy_init();
  if (!curl) throw std::runtime_error("curl_easy_init failed");

  std::string response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, lina_curl_write_cb);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string err = curl_easy_strerror(res);
    curl_easy_cleanup(curl);
    throw std::runtime_error("fetch failed: " + url + ": " + err);
  }

  curl_easy_cleanup(curl);
  return response;
}
#endif

static lina::transport_fn
make_transport() {
  return [](const std::string& location) -> std::string {
    if (is_http_url(location)) {
#ifdef LINA_HAS_CURL
      return curl_fetch(location);
#else
      throw std::runtime_error(
          "HTTP fetch not available (built without curl): " + location);
#endif
    }
    return lina::read_local_file(location);
  };
}

static std::string
default_include_location(const std::string& template_file) {
  if (is_http_url(template_file)) {
    auto slash = template_file.rfind('/');
    return template_file.substr(0, slash);
  }
  return fs::path(template_file).parent_path().string();
}

static int
run(const cli_options& opts) {
  auto transport = make_transport();

  std::string source;
  try {
    source = transport(opts.template_file);
  } catch (const std::exception& e) {
    std::cerr << "lina: " << e.what() << "\n";
    return exit_io;
  }

  // Build the root context
  lina::value_map context;
  if (!opts.context_file.empty()) {
    std::string text;
    try {
      text = transport(opts.context_file);
    } catch (const std::exception& e) {
      std::cerr << "lina: " << e.what() << "\n";
      return exit_io;
    }

    try {
      if (has_extension(opts.context_file, ".xml"))
        context = lina::parse_xml_context(text);
      else
        context = lina::parse_json_context(text);
    } catch (const std::exception& e) {
      std::cerr << "lina: error loading context " << opts.context_file << ": "
                << e.what() << "\n";
      return exit_parse;
    }
  }

  for (const auto& [name, text] : opts.defines)
    context.insert_or_assign(name, lina::value(text));

  lina::warning_fn on_warning;
  if (!opts.quiet) {
    on_warning = [](const std::string& message,
                    const lina::source_position& position) {
      std::cerr << "lina: warning: " << position << ": " << message << "\n";
    };
  }

  std::string include_location = opts.include_location.empty()
                                     ? default_include_location(opts.template_file)
                                     : opts.include_location;
  lina::template_repository repository(include_location, opts.include_suffix,
                                       transport);
  repository.set_warning_handler(on_warning);

  lina::template_options template_opts;
  template_opts.filename = opts.template_file;
  template_opts.includes = &repository;
  template_opts.on_warning = on_warning;

  std::string output;
  try {
    lina::text_template tmpl(std::move(source), std::move(template_opts));
    output = tmpl.render(context);
  } catch (const lina::template_error& e) {
    std::cerr << "lina: template error: " << e.what() << "\n";
    return exit_template;
  } catch (const std::runtime_error& e) {
    // Raised by the transport while loading an included template
    std::cerr << "lina: " << e.what() << "\n";
    return exit_io;
  }

  if (opts.output_file.empty()) {
    std::cout << output;
    return exit_success;
  }

  std::ofstream out(opts.output_file, std::ios::binary);
  if (!out) {
    std::cerr << "lina: cannot write file: " << opts.output_file << "\n";
    return exit_io;
  }
  out << output;
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.template_file.empty()) {
    std::cerr << "lina: no template given\n";
    print_usage(std::cerr);
    return exit_usage;
  }

#ifdef LINA_HAS_CURL
  curl_global_init(CURL_GLOBAL_DEFAULT);
  int rc = run(opts);
  curl_global_cleanup();
  return rc;
#else
  return run(opts);
#endif
}
