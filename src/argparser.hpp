#ifndef OBJXFER_ARGPARSER_HPP
#define OBJXFER_ARGPARSER_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace objxfer {

// Command line parser.
// Options with a value fall back to an environment variable named after the
// option: with prefix OBJXFER, --access-key-id is read from
// OBJXFER_ACCESS_KEY_ID.
class argparser {
  struct option {
    std::string value;
    std::string default_value;
    bool has_value;
  };

  std::map<std::string, std::shared_ptr<option>> _options;
  std::vector<std::string> _values;
  std::string _env_prefix;

 public:
  argparser();

  void parse(int argc, char** argv);

  // Must be called before options are added
  void set_env_prefix(const std::string& prefix) { _env_prefix = prefix; }

  void add_option(const std::string& name, const std::string& default_value);
  void add_option_alias(const std::string& name, const std::string& alias);
  void add_bool_option(const std::string& name);

  std::string get_option(const std::string& name) const;
  std::filesystem::path get_option_path(const std::string& name, bool absolute = true) const;

  // Check if the option is present on command line or in the environment
  bool has_option(const std::string& name) const;

  std::string get_value(size_t index) const;
  std::filesystem::path get_value_path(size_t index) const;

  // Values from the given index onwards
  std::vector<std::string> get_values(size_t from) const;

  // Returns the number of values
  size_t size() const { return _values.size(); }

  // Returns the value at the given index
  std::string operator[](size_t index) const { return get_value(index); }

 private:
  const option& find(const std::string& name) const;
};

}  // namespace objxfer

#endif  // OBJXFER_ARGPARSER_HPP
