#ifndef ARGS_HPP
#define ARGS_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace repostore {

// Command line parser for "--option value", "--option=value" and boolean
// flags. Value options fall back to <PREFIX>_<NAME> environment variables
// when an environment prefix is set before they are added.
class argparser {
  struct option {
    std::string value;
    std::string default_value;
    bool has_value;
  };

  std::map<std::string, std::shared_ptr<option>> _options;
  std::vector<std::string> _values;
  std::string _env_prefix;
  std::string _command;

 public:
  argparser();

  void parse(int argc, char** argv);

  void set_env_prefix(const std::string& prefix);

  void add_option(const std::string& name, const std::string& default_value);

  void add_option_alias(const std::string& name, const std::string& alias);

  void add_bool_option(const std::string& name);

  // Returns the option value, or its default if not set
  std::string get_option(const std::string& name) const;

  // Check if the option is present on command line or in the environment
  bool has_option(const std::string& name) const;

  std::string get_value(size_t index) const;

  // Returns the value at the given index, or the fallback if there are fewer values
  std::string get_value_or(size_t index, const std::string& fallback) const;

  // Returns the number of values
  size_t size() const;

  // Returns the value at the given index
  std::string operator[](size_t index) const;

  // Returns the program name
  std::string command() const;
};

}  // namespace repostore

#endif  // ARGS_HPP
