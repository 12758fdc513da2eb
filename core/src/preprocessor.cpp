#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <railog/errors.hpp>
#include <railog/io.hpp>
#include <railog/logging.hpp>
#include <railog/preprocessor.hpp>
#include <railog/types.hpp>
#include <sstream>
#include <utility>

namespace railog {

  namespace {

    bool is_blank(std::string_view line) {
      return std::ranges::all_of(line, [](unsigned char c) { return std::isspace(c) != 0; });
    }

    bool is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    // Group index for a reference name: a number, or a named group; -1 if unknown
    int group_index(std::string_view name, const RE2& re) {
      int index = 0;
      auto [end, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
      if (ec == std::errc() && end == name.data() + name.size()) {
        return index <= re.NumberOfCapturingGroups() ? index : -1;
      }
      const auto& named = re.NamedCapturingGroups();
      auto it = named.find(std::string(name));
      return it != named.end() ? it->second : -1;
    }

    using ReplacementParts = std::vector<std::variant<std::string, int>>;

    // $$ -> '$', $N / ${N} / $name / ${name} -> group, anything else literal
    ReplacementParts compile_replacement(std::string_view replacement, const RE2& re) {
      ReplacementParts parts;
      std::string literal;
      auto push_group = [&](std::string_view name) {
        if (!literal.empty()) parts.emplace_back(std::exchange(literal, {}));
        if (int index = group_index(name, re); index >= 0) parts.emplace_back(index);
      };

      size_t i = 0;
      while (i < replacement.size()) {
        if (replacement[i] != '$' || i + 1 == replacement.size()) {
          literal += replacement[i++];
          continue;
        }
        if (replacement[i + 1] == '$') {
          literal += '$';
          i += 2;
          continue;
        }
        if (replacement[i + 1] == '{') {
          auto close = replacement.find('}', i + 2);
          if (close == std::string_view::npos || close == i + 2) {
            literal += replacement[i++];
            continue;
          }
          push_group(replacement.substr(i + 2, close - i - 2));
          i = close + 1;
          continue;
        }
        size_t end = i + 1;
        while (end < replacement.size() && is_name_char(replacement[end])) ++end;
        if (end == i + 1) {
          literal += replacement[i++];
          continue;
        }
        push_group(replacement.substr(i + 1, end - i - 1));
        i = end;
      }
      if (!literal.empty()) parts.emplace_back(std::move(literal));
      return parts;
    }

  }  // namespace

  std::optional<RewriteRule> parse_rule_line(std::string_view line) {
    if (line.starts_with('#') || is_blank(line)) return std::nullopt;

    auto pos = line.find(RULE_SEPARATOR);
    if (pos == std::string_view::npos) return std::nullopt;
    if (line.find(RULE_SEPARATOR, pos + RULE_SEPARATOR.size()) != std::string_view::npos) {
      return std::nullopt;
    }

    return RewriteRule{.pattern = std::string(line.substr(0, pos)),
                       .replacement = std::string(line.substr(pos + RULE_SEPARATOR.size()))};
  }

  Preprocessor Preprocessor::from_stream(std::istream& in) {
    Preprocessor preprocessor;
    std::string line;
    size_t line_no = 0;
    while (read_line(in, line)) {
      ++line_no;
      if (auto rule = parse_rule_line(line)) {
        preprocessor.add_rule(*rule, std::format("line {}", line_no));
      } else if (!line.starts_with('#') && !is_blank(line)) {
        log_debug("Skipping malformed rule on line {}: '{}'", line_no, line);
      }
    }
    return preprocessor;
  }

  Preprocessor Preprocessor::from_file(const std::string& path) {
    auto file = open_input(path);
    auto preprocessor = from_stream(file);
    if (preprocessor.n_rules() == 0) {
      log_warn("No preprocessing rules in {}; log lines are used verbatim", path);
    } else {
      log_debug("Loaded {} preprocessing rules from {}", preprocessor.n_rules(), path);
    }
    return preprocessor;
  }

  Preprocessor Preprocessor::from_string(std::string_view rules_text) {
    std::istringstream in{std::string(rules_text)};
    return from_stream(in);
  }

  Preprocessor Preprocessor::from_rules(const std::vector<RewriteRule>& rules) {
    Preprocessor preprocessor;
    preprocessor.rules_.reserve(rules.size());
    for (size_t i = 0; i < rules.size(); ++i) {
      preprocessor.add_rule(rules[i], std::format("rule {}", i + 1));
    }
    return preprocessor;
  }

  void Preprocessor::add_rule(const RewriteRule& rule, std::string_view origin) {
    RE2::Options options;
    options.set_log_errors(false);
    auto re = std::make_unique<RE2>(rule.pattern, options);
    if (!re->ok()) {
      throw FormatError(
          std::format("Invalid pattern on {} '{}': {}", origin, rule.pattern, re->error()));
    }
    auto replacement = compile_replacement(rule.replacement, *re);
    rules_.push_back(CompiledRule{std::move(re), std::move(replacement)});
  }

  std::string Preprocessor::apply(const CompiledRule& rule, const std::string& text) {
    const auto n_groups = 1 + rule.re->NumberOfCapturingGroups();
    std::vector<re2::StringPiece> groups(static_cast<size_t>(n_groups));
    const re2::StringPiece input(text);

    std::string out;
    size_t pos = 0;
    while (pos <= text.size()
           && rule.re->Match(input, pos, text.size(), RE2::UNANCHORED, groups.data(), n_groups)) {
      const auto start = static_cast<size_t>(groups[0].data() - text.data());
      const auto end = start + groups[0].size();
      out.append(text, pos, start - pos);
      for (const auto& part : rule.replacement) {
        std::visit(overloaded{[&](const std::string& literal) { out += literal; },
                              [&](int index) {
                                const auto& group = groups[static_cast<size_t>(index)];
                                if (group.data() != nullptr) out.append(group.data(), group.size());
                              }},
                   part);
      }
      if (end == start) {
        // Empty match: keep the next UTF-8 character and search past it
        pos = start + 1;
        while (pos < text.size() && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) ++pos;
        if (start < text.size()) out.append(text, start, pos - start);
      } else {
        pos = end;
      }
    }
    if (pos < text.size()) out.append(text, pos);
    return out;
  }

  std::string Preprocessor::normalize(std::string_view raw_line) const {
    std::string message(raw_line);
    for (const auto& rule : rules_) {
      message = apply(rule, message);
    }
    return message;
  }

}  // namespace railog
