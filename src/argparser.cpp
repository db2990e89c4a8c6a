#include "argparser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace repostore {

argparser::argparser() {}

void argparser::parse(int argc, char** argv) {
  _command = argc > 0 ? argv[0] : "";

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    // A lone dash is a value, commonly meaning stdout
    if (arg.size() > 1 && arg[0] == '-') {
      // --option=value
      size_t pos = arg.find('=');
      if (pos != std::string::npos) {
        std::string name = arg.substr(0, pos);
        std::string value = arg.substr(pos + 1);
        if (_options.find(name) == _options.end()) {
          throw std::invalid_argument("unknown option: " + name);
        }
        if (!_options[name]->has_value) {
          throw std::invalid_argument("option does not take a value: " + name);
        }
        _options[name]->value = value;
        continue;
      }

      // --option value
      if (_options.find(arg) == _options.end()) {
        throw std::invalid_argument("unknown option: " + arg);
      }

      if (_options[arg]->has_value) {
        if (i + 1 >= argc) {
          throw std::invalid_argument("missing value for option: " + arg);
        }
        _options[arg]->value = argv[++i];
      }
      else {
        _options[arg]->value = "true";
      }
    }
    else {
      _values.push_back(arg);
    }
  }
}

void argparser::set_env_prefix(const std::string& prefix) { _env_prefix = prefix; }

void argparser::add_option(const std::string& name, const std::string& default_value) {
  _options[name] = std::make_shared<option>(option{"", default_value, true});

  // Check if the option is set in the environment
  if (!_env_prefix.empty()) {
    // Replace - with _
    std::string env_name = _env_prefix + "_" + name.substr(2);
    std::replace(env_name.begin(), env_name.end(), '-', '_');

    // Convert to uppercase
    std::transform(env_name.begin(), env_name.end(), env_name.begin(), ::toupper);

    if (const char* env_value = std::getenv(env_name.c_str())) {
      _options[name]->value = env_value;
    }
  }
}

void argparser::add_option_alias(const std::string& name, const std::string& alias) {
  if (_options.find(name) == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  _options[alias] = _options[name];
}

void argparser::add_bool_option(const std::string& name) {
  _options[name] = std::make_shared<option>(option{"", "", false});
}

std::string argparser::get_option(const std::string& name) const {
  auto it = _options.find(name);
  if (it == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  if (it->second->value.empty()) {
    return it->second->default_value;
  }
  return it->second->value;
}

bool argparser::has_option(const std::string& name) const {
  auto it = _options.find(name);
  if (it == _options.end()) {
    throw std::invalid_argument("unknown option: " + name);
  }
  return !it->second->value.empty();
}

std::string argparser::get_value(size_t index) const {
  if (index >= _values.size()) {
    throw std::invalid_argument("index out of range");
  }
  return _values[index];
}

std::string argparser::get_value_or(size_t index, const std::string& fallback) const {
  if (index >= _values.size()) {
    return fallback;
  }
  return _values[index];
}

size_t argparser::size() const { return _values.size(); }

std::string argparser::operator[](size_t index) const { return get_value(index); }

std::string argparser::command() const { return _command; }

}  // namespace repostore
