#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace floorsheet {

// Variables from dotenv files layered over the process environment. Values
// loaded from a file win over the process environment.
class EnvLoader {
public:
  static EnvLoader &instance() {
    static EnvLoader instance({".env.local"});
    return instance;
  }

  // Missing files are skipped; later files override earlier ones.
  explicit EnvLoader(std::vector<std::filesystem::path> const &files) {
    for (auto const &file : files) {
      if (std::filesystem::exists(file)) {
        loadFile(file);
        SPDLOG_INFO("Loaded environment from {}.", file.string());
      }
    }
  }

  std::optional<std::string> find(const std::string &key) const {
    if (auto it = m_variables.find(key); it != m_variables.end()) {
      return it->second;
    }
    if (const char *value = std::getenv(key.c_str())) {
      return std::string(value);
    }
    return std::nullopt;
  }

  std::string get(const std::string &key, const std::string &defaultValue = "") const {
    auto value = find(key);
    return value && !value->empty() ? *value : defaultValue;
  }

  int getInt(const std::string &key, int defaultValue = 0) const {
    std::string value = get(key);
    if (value.empty()) return defaultValue;
    try {
      size_t used = 0;
      int parsed = std::stoi(value, &used);
      if (used == value.size()) return parsed;
    } catch (const std::exception &exp) {
      SPDLOG_WARN("Failed to parse environment variable '{}' with value '{}' as integer: {}",
                  key, value, exp.what());
    }
    SPDLOG_WARN("Ignoring environment variable '{}'='{}', using default value: {}", key,
                value, defaultValue);
    return defaultValue;
  }

  bool getBool(const std::string &key, bool defaultValue = false) const {
    std::string value = get(key);
    if (value.empty()) return defaultValue;
    return value == "true" || value == "1" || value == "yes";
  }

  size_t size() const { return m_variables.size(); }

private:
  std::unordered_map<std::string, std::string> m_variables;

  void loadFile(const std::filesystem::path &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return;

    std::string line;
    while (std::getline(file, line)) {
      parseLine(line);
    }
  }

  void parseLine(const std::string &line) {
    auto content = trim(line);
    if (content.empty() || content[0] == '#') return;
    if (content.starts_with("export ")) content = trim(content.substr(7));

    size_t pos = content.find('=');
    if (pos == std::string::npos) return;

    std::string key = trim(content.substr(0, pos));
    std::string value = trim(content.substr(pos + 1));

    if (value.length() >= 2) {
      if ((value.front() == '"' && value.back() == '"') ||
          (value.front() == '\'' && value.back() == '\'')) {
        value = value.substr(1, value.length() - 2);
      }
    }

    value = expandVariables(value);
    if (!key.empty()) {
      m_variables[key] = value;
    }
  }

  // ${VAR} references resolve against variables loaded so far, then the
  // process environment.
  std::string expandVariables(const std::string &value) const {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find("${", pos)) != std::string::npos) {
      size_t end = result.find('}', pos);
      if (end == std::string::npos) break;

      std::string varName = result.substr(pos + 2, end - pos - 2);
      std::string varValue = get(varName);

      result.replace(pos, end - pos + 1, varValue);
      pos += varValue.length();
    }

    return result;
  }

  static std::string trim(const std::string &str) {
    const auto strBegin = str.find_first_not_of(" \t\r\n");
    if (strBegin == std::string::npos) return "";

    const auto strEnd = str.find_last_not_of(" \t\r\n");
    return str.substr(strBegin, strEnd - strBegin + 1);
  }
};

} // namespace floorsheet
