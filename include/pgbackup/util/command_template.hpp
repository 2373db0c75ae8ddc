#pragma once

#include <map>
#include <string>
#include <string_view>

namespace pgbackup {

using TemplateVars = std::map<std::string, std::string, std::less<>>;

// Quotes `value` for /bin/sh so it is passed as a single word.
[[nodiscard]] auto shell_quote(std::string_view value) -> std::string;

// Replaces `{name}` placeholders with values from `vars`. With `quote` set
// every substituted value is shell-quoted. Unknown placeholders stay verbatim.
[[nodiscard]] auto expand_template(std::string_view tmpl,
                                   const TemplateVars& vars, bool quote)
    -> std::string;

}  // namespace pgbackup
