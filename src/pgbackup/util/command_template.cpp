#include "pgbackup/util/command_template.hpp"

namespace pgbackup {

auto shell_quote(std::string_view value) -> std::string {
  if (!value.empty() &&
      value.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
                              "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "0123456789@%_-+=:,./") == std::string_view::npos) {
    return std::string(value);
  }

  std::string out;
  out.reserve(value.size() + 2);
  out += '\'';
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

auto expand_template(std::string_view tmpl, const TemplateVars& vars,
                     bool quote) -> std::string {
  std::string out;
  out.reserve(tmpl.size() + 64);

  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    auto open = tmpl.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }
    out.append(tmpl.substr(pos, open - pos));

    auto close = tmpl.find('}', open + 1);
    if (close == std::string_view::npos) {
      out.append(tmpl.substr(open));
      break;
    }

    auto name = tmpl.substr(open + 1, close - open - 1);
    if (auto it = vars.find(name); it != vars.end()) {
      out += quote ? shell_quote(it->second) : it->second;
    } else {
      out.append(tmpl.substr(open, close - open + 1));
    }
    pos = close + 1;
  }
  return out;
}

}  // namespace pgbackup
