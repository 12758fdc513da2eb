#pragma once
#include <istream>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace railog {

  struct RewriteRule {
    std::string pattern;
    std::string replacement;
  };

  // Separator between pattern and replacement in a rule file line
  inline constexpr std::string_view RULE_SEPARATOR = " :: ";

  /**
   * Canonicalizes raw log lines with an ordered list of regex substitutions.
   *
   * Each rule replaces all of its matches before the next rule runs. Patterns
   * use RE2 syntax and match in time linear in the line length, so arbitrarily
   * long lines are safe. Replacements may reference groups as $1, ${1}, $name
   * or ${name}; $$ is a literal dollar and unknown groups expand to nothing.
   */
  class Preprocessor {
  public:
    Preprocessor() = default;

    Preprocessor(Preprocessor&&) = default;
    Preprocessor& operator=(Preprocessor&&) = default;
    Preprocessor(const Preprocessor&) = delete;
    Preprocessor& operator=(const Preprocessor&) = delete;

    // Rule file: one `<pattern> :: <replacement>` per line, `#` comments and
    // blank lines ignored, lines without exactly one separator skipped.
    [[nodiscard]] static Preprocessor from_file(const std::string& path);
    [[nodiscard]] static Preprocessor from_string(std::string_view rules_text);
    [[nodiscard]] static Preprocessor from_rules(const std::vector<RewriteRule>& rules);

    [[nodiscard]] std::string normalize(std::string_view raw_line) const;

    [[nodiscard]] size_t n_rules() const noexcept { return rules_.size(); }

  private:
    // Literal text or a capture group index
    using ReplacementPart = std::variant<std::string, int>;

    struct CompiledRule {
      std::unique_ptr<RE2> re;
      std::vector<ReplacementPart> replacement;
    };

    [[nodiscard]] static Preprocessor from_stream(std::istream& in);

    // `origin` names the rule in error messages ("line 3", "rule 2")
    void add_rule(const RewriteRule& rule, std::string_view origin);

    [[nodiscard]] static std::string apply(const CompiledRule& rule, const std::string& text);

    std::vector<CompiledRule> rules_;
  };

  // Parses one rule file line; empty when the line is a comment, blank or malformed
  [[nodiscard]] std::optional<RewriteRule> parse_rule_line(std::string_view line);

}  // namespace railog
