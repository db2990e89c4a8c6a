#include "argparser.hpp"
#include "base64.hpp"
#include "event.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "remote.hpp"
#include "sink.hpp"
#include "store.hpp"
#include "url.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

int usage() {
  std::cerr << "repostore ls [<path>]" << std::endl;
  std::cerr << "repostore ls-all [<path>]" << std::endl;
  std::cerr << "repostore get <path> <name> [<output>|-]" << std::endl;
  std::cerr << "repostore cat-base64 <path> <name>" << std::endl;
  std::cerr << "repostore put [--no-overwrite] <file> [<path>] [<name>]" << std::endl;
  std::cerr << "repostore put-base64 [--no-overwrite] <content> [<path>] [<name>]" << std::endl;
  std::cerr << "repostore rm <path> <name>" << std::endl;
  std::cerr << "repostore download-all [<path>] [<directory>]" << std::endl;
  std::cerr << std::endl;
  std::cerr << "options: --repo <owner/repo> --token <token> [--api <url>] [--branch <name>]" << std::endl;
  std::cerr << "         [--log-level debug|info|warn|error|off] [--json]" << std::endl;
  return EXIT_FAILURE;
}

int version() {
  std::cout << "repostore " << REPOSTORE_VERSION << std::endl;
  return EXIT_SUCCESS;
}

std::string tolower(std::string s) {
  // Convert string to lowercase
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string display_path(const std::string& path) { return path.empty() ? "/" : path; }

void print_listing(const std::vector<repostore::file_descriptor>& entries) {
  for (const auto& entry : entries) {
    if (repostore::events_enabled()) {
      repostore::event("entry", repostore::to_json(entry));
      continue;
    }
    std::cout << std::setw(40) << entry.revision << " " << std::setw(4) << std::left
              << repostore::to_string(entry.kind) << std::right << " " << entry.path << std::endl;
  }
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("failed to open file for reading: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(file), {});
}

void write_output(const std::string& output, const std::string& data) {
  std::unique_ptr<repostore::sink> out;
  if (output.empty() || output == "-") {
    out = std::make_unique<repostore::ostream_sink>(std::cout);
  }
  else {
    out = std::make_unique<repostore::file_sink>(output);
  }

  try {
    out->write(data.data(), data.size());
    out->close();
  }
  catch (const std::exception&) {
    out->abort();
    throw;
  }
}

int print_upload(const std::string& target, const repostore::upload_outcome& outcome) {
  if (repostore::events_enabled()) {
    repostore::event(
        "upload", {{"path", target}, {"status", repostore::to_string(outcome.status)}, {"sha", outcome.revision}});
  }
  else if (outcome.status == repostore::upload_status::skipped_exists) {
    std::cout << "skipped" << std::endl;
  }
  else {
    std::cout << outcome.revision << std::endl;
  }
  return EXIT_SUCCESS;
}

int cmd_repostore(const repostore::argparser& args) {
  repostore::set_log_level(repostore::parse_log_level(args.get_option("--log-level")));

  if (args.size() < 1) throw std::invalid_argument("missing command argument");

  repostore::remote_options options;
  options.api_url = args.get_option("--api");
  options.repository = args.get_option("--repo");
  options.token = args.get_option("--token");
  options.branch = args.get_option("--branch");

  if (repostore::url(options.api_url).host().empty())
    throw std::invalid_argument("invalid API URL: " + options.api_url);
  if (options.repository.find('/') == std::string::npos)
    throw std::invalid_argument("invalid repository, expected owner/repo: " + options.repository);

  std::unique_ptr<repostore::remote> remote = repostore::remote::create(options);
  repostore::file_store store(*remote);

  repostore::overwrite_policy policy =
      args.has_option("--no-overwrite") ? repostore::overwrite_policy::reject : repostore::overwrite_policy::allow;

  if (args[0] == "ls") {
    print_listing(store.list_files(args.get_value_or(1, "")));
    return EXIT_SUCCESS;
  }
  else if (args[0] == "ls-all") {
    print_listing(store.list_all_files(args.get_value_or(1, "")));
    return EXIT_SUCCESS;
  }
  else if (args[0] == "get") {
    if (args.size() < 3) throw std::invalid_argument("missing path or name argument");

    repostore::fetched_content content = store.fetch_content(args[1], args[2]);
    if (content.url) {
      // Too large to be returned inline
      if (repostore::events_enabled())
        repostore::event("url", {{"path", repostore::join_path({args[1], args[2]})}, {"url", *content.url}});
      else
        std::cout << *content.url << std::endl;
      return EXIT_SUCCESS;
    }

    write_output(args.get_value_or(3, "-"), repostore::base64_decode(*content.encoded_content));
    return EXIT_SUCCESS;
  }
  else if (args[0] == "cat-base64") {
    if (args.size() < 3) throw std::invalid_argument("missing path or name argument");

    repostore::encoded_file file = store.fetch_content_base64(args[1], args[2]);
    if (repostore::events_enabled())
      repostore::event("content", {{"filename", file.name}, {"content", file.content}});
    else
      std::cout << file.content << std::endl;
    return EXIT_SUCCESS;
  }
  else if (args[0] == "put") {
    if (args.size() < 2) throw std::invalid_argument("missing file argument");

    std::filesystem::path local = args[1];
    std::string path = args.get_value_or(2, "");
    std::string name = args.get_value_or(3, local.filename().string());

    std::string data = read_file(local);
    if (data.empty()) throw std::invalid_argument("file is empty: " + local.string());

    repostore::upload_outcome outcome = store.upload(repostore::base64_encode(data), path, name, policy);
    return print_upload(repostore::join_path({path, name}), outcome);
  }
  else if (args[0] == "put-base64") {
    if (args.size() < 2) throw std::invalid_argument("missing content argument");

    std::string path = args.get_value_or(2, "");
    std::string name = args.get_value_or(3, "uploaded_file.txt");

    repostore::upload_outcome outcome = store.upload(args[1], path, name, policy);
    return print_upload(repostore::join_path({path, name}), outcome);
  }
  else if (args[0] == "rm") {
    if (args.size() < 3) throw std::invalid_argument("missing path or name argument");

    store.delete_file(args[1], args[2]);
    if (repostore::events_enabled())
      repostore::event("delete", {{"path", repostore::join_path({args[1], args[2]})}});
    return EXIT_SUCCESS;
  }
  else if (args[0] == "download-all") {
    std::string path = args.get_value_or(1, "");
    std::filesystem::path directory =
        std::filesystem::absolute(args.get_value_or(2, std::filesystem::current_path().string())).lexically_normal();
    std::filesystem::path output = directory / "output.zip";

    repostore::file_sink out(output);
    size_t entries = store.download_archive(path, out);

    if (repostore::events_enabled())
      repostore::event("archive", {{"path", display_path(path)}, {"file", output.string()}, {"entries", entries}});
    else
      std::cout << output.string() << std::endl;
    return EXIT_SUCCESS;
  }
  else {
    throw std::invalid_argument("unknown command: " + args[0]);
  }
}

int main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      return usage();
    }

    repostore::argparser args;
    args.set_env_prefix("REPOSTORE");
    args.add_option("--repo", "");
    args.add_option_alias("--repo", "-r");
    args.add_option("--token", "");
    args.add_option_alias("--token", "-t");
    args.add_option("--api", "https://api.github.com");
    args.add_option("--branch", "");
    args.add_option_alias("--branch", "-b");
    args.add_option("--log-level", "off");
    args.add_option_alias("--log-level", "-l");
    args.add_bool_option("--no-overwrite");
    args.add_bool_option("--json");
    args.add_option_alias("--json", "-J");
    args.add_bool_option("--help");
    args.add_option_alias("--help", "-h");
    args.add_bool_option("--version");
    args.add_option_alias("--version", "-V");
    args.parse(argc, argv);

    if (args.has_option("--help")) return usage();
    if (args.has_option("--version")) return version();
    if (args.has_option("--json")) repostore::set_events_enabled();

    return cmd_repostore(args);
  }
  catch (const std::exception& e) {
    std::cerr << "error: " << tolower(e.what()) << std::endl;
    return EXIT_FAILURE;
  }
}
