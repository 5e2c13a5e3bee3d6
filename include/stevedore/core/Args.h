#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stevedore::core {

// Small argument parser for the command-line tools.
//
//  --flag  -h         flags
//  --key value        key/value (last one wins in last(); values() keeps all)
//  --key=value
//  anything else      positional
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a.rfind("--", 0) == 0) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        if (i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].push_back(std::string(argv[++i]));
        } else {
          flags_.push_back(key);
        }
        continue;
      }

      if (a[0] == '-' && a.size() >= 2 && !isNumber(a)) {
        for (std::size_t j = 1; j < a.size(); ++j) {
          if (std::isalnum((unsigned char)a[j])) flags_.push_back(std::string(1, a[j]));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& positional() const { return positional_; }

  // Typed getters: true only when the key is present and parses completely.
  bool getU64(std::string_view key, unsigned long long& out) const {
    const auto v = last(key);
    if (!v || v->empty() || (*v)[0] == '-') return false;
    char* end = nullptr;
    const auto val = std::strtoull(v->c_str(), &end, 10);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getInt(std::string_view key, int& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtol(v->c_str(), &end, 10);
    if (*end != '\0') return false;
    out = static_cast<int>(val);
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v || v->empty()) return false;
    char* end = nullptr;
    const auto val = std::strtod(v->c_str(), &end);
    if (*end != '\0') return false;
    out = val;
    return true;
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

private:
  static bool isSwitch(const char* s) {
    return s && s[0] == '-' && !isNumber(s);
  }

  // "-5" and "-0.25" are values, not short flags.
  static bool isNumber(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    return std::isdigit((unsigned char)s[1]) || s[1] == '.';
  }

  std::string program_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace stevedore::core
