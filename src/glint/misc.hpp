#pragma once

#include <cctype>

#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <type_traits>
#include <variant>

#include "common.hpp"
#include "format.hpp"
#include "geometry.hpp"


namespace glint {

using std::string, std::vector;

//
// strip string
//
inline string lstrip(const string& s) {
  auto it = std::find_if(s.begin(), s.end(), [](unsigned char c){ return !std::isspace(c); });
  return string{it, s.end()};
}

inline string rstrip(const string& s) {
  auto it = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){ return !std::isspace(c); });
  return string{s.begin(), it.base()};
}

inline string strip(const string& s) {
  return lstrip(rstrip(s));
}

// "" when `s` has no directory part
inline string dirname(const string& s) {
  auto pos = s.rfind('/');
  return pos == string::npos ? "" : s.substr(0, pos);
}


//
// String to value (throws "ValueError: ..." on garbage)
//
template<typename T>
inline T sto(const string& s) {
  std::istringstream istr{s};
  T result{};
  istr >> result;
  if (istr.fail() || !(istr >> std::ws).eof())
    throw std::runtime_error{format("ValueError: cannot convert \"%s\"", s)};
  return result;
}

template<>
inline string sto(const string& s) {
  return s;
}

template<>
inline bool sto(const string& s) {
  for (auto word : {"1", "true", "yes", "on"})
    if (s == word) return true;
  for (auto word : {"0", "false", "no", "off"})
    if (s == word) return false;
  throw std::runtime_error{format("ValueError: cannot convert \"%s\" to bool", s)};
}

template<>
inline fvec3 sto(const string& s) {
  fvec3 v{0};
  std::istringstream istr{s};
  istr >> v[0] >> v[1] >> v[2];
  if (istr.fail() || !(istr >> std::ws).eof())
    throw std::runtime_error{format("ValueError: cannot convert \"%s\" to vec3", s)};
  return v;
}


//
// Command line parser
//
struct Cli {
  const int argc; const char** argv;
  string help_message;

  string help() {
    return format("usage: %s %s\n", argv[0], rstrip(help_message));
  }

  template<typename T>
  std::optional<T> getArg(const string& flag) {
    help_message += format("[%s ?] ", flag);
    for (auto i = 1; i + 1 < argc; i++) {
      if (argv[i] == flag) {
        return sto<T>(argv[i + 1]);
      }
    }
    return {};
  }

  bool checkArg(const string& flag) {
    help_message += format("[%s] ", flag);
    for (auto i = 1; i < argc; i++) {
      if (argv[i] == flag) {
        return true;
      }
    }
    return false;
  }
};


//
// Minimal Yaml-like language for scene and render settings
// - fixed indent for nesting: two spaces
// - data types: null, string, dict, list
// - "#" starts a comment until the end of line
//

using std::map, std::variant, std::shared_ptr, std::make_shared;

struct Yeml {
  struct Null {};
  using Dict = map<string, shared_ptr<Yeml>>;
  using List = vector<shared_ptr<Yeml>>;
  variant<Null, Dict, List, string> data;

  Yeml() : data{Null{}} { }
  Yeml(const string& in_data) : data{in_data} { }
  explicit operator bool() const { return !isNull(); }

  bool isNull() const { return std::holds_alternative<Null>(data); }
  bool isDict() const { return std::holds_alternative<Dict>(data); }
  bool isList() const { return std::holds_alternative<List>(data); }
  bool isStr()  const { return std::holds_alternative<string>(data); }

  const Dict&   asDict() const { return std::get<Dict>(data);   }
  const List&   asList() const { return std::get<List>(data);   }
  const string& s()      const { return std::get<string>(data); }

  // safe getter
  std::optional<shared_ptr<Yeml>> d(const string& key) const {
    if (!isDict()) return {};
    auto it = asDict().find(key);
    if (it == asDict().end()) return {};
    return it->second;
  }

  // safe getter (directly string value)
  std::optional<string> ds(const string& key) const {
    auto opt = d(key);
    if (!opt || !(*opt)->isStr()) return {};
    return (*opt)->s();
  }

  // safe typed getter, `fallback` when absent
  template<typename T>
  T get(const string& key, const T& fallback) const {
    auto opt = ds(key);
    return opt ? sto<T>(*opt) : fallback;
  }

  // unsafe getter
  const Yeml& operator[](const string& key) const {
    auto opt = d(key);
    if (!opt)
      throw std::runtime_error{format("KeyError: %s", key)};
    return **opt;
  }

  // unsafe getter (directly string reference)
  const string& operator()(const string& key) const {
    const Yeml& y = (*this)[key];
    if (!y.isStr())
      throw std::runtime_error{format("TypeError: key [\"%s\"] not string", key)};
    return y.s();
  }


  //
  // Parser implementation
  //
  struct Parser {
    // Every meaningful line is one of
    //   xyz        kScalar
    //   xyz:       kKey
    //   xyz: abc   kKeyValue
    //   -          kDash
    //   - xyz      kDashScalar
    //   - xyz:     kDashKey
    //   - xyz: abc kDashKeyValue
    enum class Kind { kScalar, kKey, kKeyValue, kDash, kDashScalar, kDashKey, kDashKeyValue };

    struct Line {
      Kind kind;
      string key, value;
    };

    std::istream& istr;

    // Peek the next line with comment and trailing spaces removed, skipping blank ones
    bool peek(/*out*/ string& line) {
      while (true) {
        auto pos = istr.tellg();
        if (!std::getline(istr, line))
          return false;
        line = rstrip(line.substr(0, line.find('#')));
        if (!line.empty()) {
          istr.seekg(pos, std::ios_base::beg);
          return true;
        }
      }
    }

    static Line classify(const string& text) {
      if (text == "-")
        return Line{Kind::kDash, "", ""};

      bool dash = text.compare(0, 2, "- ") == 0;
      string rest = dash ? text.substr(2) : text;
      auto sep = rest.find(": ");
      if (rest.back() == ':')
        return Line{dash ? Kind::kDashKey : Kind::kKey, rest.substr(0, rest.size() - 1), ""};
      if (sep != string::npos)
        return Line{dash ? Kind::kDashKeyValue : Kind::kKeyValue, rest.substr(0, sep), strip(rest.substr(sep + 2))};
      return Line{dash ? Kind::kDashScalar : Kind::kScalar, rest, ""};
    }

    // Parse consecutive lines sharing one indent (at least `min_indent`) into `result`.
    // Siblings are consumed in a loop, only nesting recurses.
    void parseBlock(int min_indent, /*inout*/ Yeml& result) {
      int block_indent = -1;
      string line;
      while (peek(line)) {
        string text = lstrip(line);
        int indent = line.size() - text.size();
        int expected = block_indent < 0 ? min_indent : block_indent;
        if (indent < expected)
          return;

        std::getline(istr, line);
        string error_message = format(R"(SyntaxError: unexpected line "%s")", line);
        if (indent > expected && !result.isNull())
          throw std::runtime_error{error_message};
        block_indent = indent;

        Line l = classify(text);
        bool is_dict = l.kind == Kind::kKey || l.kind == Kind::kKeyValue;
        bool is_list = !is_dict && l.kind != Kind::kScalar;
        if (l.kind == Kind::kScalar && !result.isNull())
          throw std::runtime_error{error_message};
        if (is_dict) {
          if (result.isNull()) result.data = Dict{};
          if (!result.isDict()) throw std::runtime_error{error_message};
        }
        if (is_list) {
          if (result.isNull()) result.data = List{};
          if (!result.isList()) throw std::runtime_error{error_message};
        }

        switch (l.kind) {
          case Kind::kScalar: {
            result.data = l.key;
            return;
          }
          case Kind::kKey: {
            auto inner = make_shared<Yeml>();
            parseBlock(indent + 2, *inner);
            std::get<Dict>(result.data)[l.key] = inner;
            break;
          }
          case Kind::kKeyValue: {
            std::get<Dict>(result.data)[l.key] = make_shared<Yeml>(l.value);
            break;
          }
          case Kind::kDash: {
            auto item = make_shared<Yeml>();
            parseBlock(indent + 2, *item);
            std::get<List>(result.data).push_back(item);
            break;
          }
          case Kind::kDashScalar: {
            std::get<List>(result.data).push_back(make_shared<Yeml>(l.key));
            break;
          }
          case Kind::kDashKey: {
            // "- xyz:" nests its value two columns deeper than the item's other keys
            auto value = make_shared<Yeml>();
            parseBlock(indent + 4, *value);
            auto item = make_shared<Yeml>();
            item->data = Dict{{l.key, value}};
            parseBlock(indent + 2, *item);
            std::get<List>(result.data).push_back(item);
            break;
          }
          case Kind::kDashKeyValue: {
            auto item = make_shared<Yeml>();
            item->data = Dict{{l.key, make_shared<Yeml>(l.value)}};
            parseBlock(indent + 2, *item);
            std::get<List>(result.data).push_back(item);
            break;
          }
        }
      }
    }
  };

  static Yeml parse(std::istream& istr) {
    Yeml result;
    Parser parser{istr};
    parser.parseBlock(/*min_indent*/ 0, result);
    string rest;
    if (parser.peek(rest))
      throw std::runtime_error{format(R"(SyntaxError: unexpected line "%s")", rest)};
    return result;
  }

  static Yeml parse(const string& str) {
    std::istringstream istr{str};
    return parse(istr);
  }

  static Yeml parseFile(const string& filename) {
    std::ifstream istr{filename};
    if (!istr.is_open())
      throw std::runtime_error{format("IOError: cannot open \"%s\"", filename)};
    return parse(istr);
  }
};


} // namespace glint
