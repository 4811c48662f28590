#ifndef WRX_STRING_H
#define WRX_STRING_H

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ostream>

// Wrapper around std::string with the splitting and trimming helpers the
// report parsers need
class wrx_string
{
  std::string str;
public:
  static const size_t npos = std::string::npos;
  wrx_string() : str() {}
  wrx_string(const char* s) : str(s) {}
  wrx_string(const char* s, size_t len) : str(s, len) {}
  wrx_string(const std::string& s) : str(s) {}
  wrx_string(std::string&& s) : str(std::move(s)) {}
  wrx_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  wrx_string operator+(const wrx_string& s) const { return str + s.str; }
  wrx_string operator+(const char* s) const { return str + s; }
  wrx_string& operator+=(const wrx_string& s) { str += s.str; return *this; }
  wrx_string& operator+=(char c) { str += c; return *this; }
  bool operator==(const wrx_string& s) const { return str == s.str; }
  bool operator!=(const wrx_string& s) const { return str != s.str; }
  bool operator<(const wrx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  size_t length() const { return str.length(); }
  void clear() { str.clear(); }

  char& operator[](size_t i) { return str[i]; }
  const char& operator[](size_t i) const { return str[i]; }

  // last byte, '\0' for an empty string
  char last() const { return str.empty() ? '\0' : str.back(); }

  wrx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  size_t find(const wrx_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  size_t rfind(const wrx_string& s) const { return str.rfind(s.str); }
  bool contains(const wrx_string& s) const { return str.find(s.str) != std::string::npos; }

  wrx_string& replace(const wrx_string& from, const wrx_string& to)
  {
    if (from.empty()) return *this;
    for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size())
      str.replace(pos, from.size(), to.str);
    return *this;
  }

  wrx_string replaced(const wrx_string& from, const wrx_string& to) const
  {
    wrx_string result = *this;
    result.replace(from, to);
    return result;
  }

  wrx_string remove(const wrx_string& substring) const
  {
    return replaced(substring, "");
  }

  size_t split(const wrx_string& delim, std::vector<wrx_string>& out) const
  {
    size_t pos = 0;
    size_t lastPos = 0;
    while ((pos = str.find(delim.str, lastPos)) != std::string::npos)
    {
      out.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = pos + delim.size();
    }
    out.push_back(str.substr(lastPos));
    return out.size();
  }

  std::vector<wrx_string> split(const wrx_string& delim) const
  {
    std::vector<wrx_string> out;
    split(delim, out);
    return out;
  }

  // Split from the left into at most max_parts parts, the last part keeps
  // the remaining delimiters
  std::vector<wrx_string> splitn(const wrx_string& delim, size_t max_parts) const
  {
    std::vector<wrx_string> out;
    if (max_parts == 0) return out;
    size_t lastPos = 0;
    size_t pos = 0;
    while (out.size() + 1 < max_parts && (pos = str.find(delim.str, lastPos)) != std::string::npos)
    {
      out.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = pos + delim.size();
    }
    out.push_back(str.substr(lastPos));
    return out;
  }

  // Split from the right into at most max_parts parts. The rightmost part
  // comes first, the last part keeps the remaining delimiters.
  std::vector<wrx_string> rsplitn(const wrx_string& delim, size_t max_parts) const
  {
    std::vector<wrx_string> out;
    if (max_parts == 0) return out;
    size_t end = str.size();
    while (out.size() + 1 < max_parts && end >= delim.size() && !delim.empty())
    {
      size_t pos = str.rfind(delim.str, end - delim.size());
      if (pos == std::string::npos) break;
      out.push_back(str.substr(pos + delim.size(), end - pos - delim.size()));
      end = pos;
    }
    out.push_back(str.substr(0, end));
    return out;
  }

  wrx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return wrx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  bool starts_with(const wrx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool ends_with(const wrx_string& suffix) const
  {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix.str) == 0;
  }

  wrx_string join(const std::vector<wrx_string>& parts) const
  {
    if (parts.empty()) return wrx_string();
    wrx_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      result += *this + parts[i];
    }
    return result;
  }

  wrx_string lower() const
  {
    wrx_string res = *this;
    for (size_t i = 0; i < res.size(); ++i)
    {
      res[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res[i])));
    }
    return res;
  }

  bool is_digits() const
  {
    if (str.empty()) return false;
    for (char c : str) {
      if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
  }

  // Strict unsigned parse, the whole string has to be digits
  bool to_u64(uint64_t& out) const
  {
    if (!is_digits()) return false;
    try
    {
      size_t used = 0;
      unsigned long long v = std::stoull(str, &used);
      if (used != str.size()) return false;
      out = v;
      return true;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }

  // Strict floating point parse, trailing garbage is rejected
  bool to_double(double& out) const
  {
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) return false;
    try
    {
      size_t used = 0;
      double v = std::stod(str, &used);
      if (used != str.size()) return false;
      out = v;
      return true;
    }
    catch (const std::invalid_argument&)
    {
      return false;
    }
    catch (const std::out_of_range&)
    {
      return false;
    }
  }
};

inline wrx_string operator+(const char* lhs, const wrx_string& rhs) {
    return wrx_string(lhs) + rhs;
}

inline std::ostream& operator<<(std::ostream& os, const wrx_string& s) {
    return os << s.to_std_const();
}

#endif // WRX_STRING_H
