#include "wrx_env.h"
#include <fstream>
#include <cstdlib>

void load_env_file(const wrx_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    wrx_string wrx_line(line);
    wrx_line = wrx_line.trim();

    if (wrx_line.empty() || wrx_line.starts_with("#")) {
      continue;
    }

    size_t pos = wrx_line.find("=");
    if (pos == wrx_string::npos) {
      continue;
    }

    wrx_string key = wrx_line.substr(0, pos).trim();
    wrx_string value = wrx_line.substr(pos + 1).trim();

    // quoted values keep their inner text only
    if (value.size() >= 2 && value[0] == '"' && value.last() == '"') {
      value = value.substr(1, value.size() - 2);
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
}

wrx_string env_or(const char* name, const wrx_string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return fallback;
  }
  return wrx_string(value);
}
