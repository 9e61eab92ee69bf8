#include <latex.hpp>

#include <jot.hpp>
#include <optional>
#include <rkhash.hpp>
#include <set>

static constexpr std::string_view BEGIN_COMMENT = "\\begin{comment}";
static constexpr std::string_view END_COMMENT   = "\\end{comment}";

static bool is_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
static bool is_blank(char c) { return c == ' ' || c == '\t'; }

namespace {
class parser_t {
private:
  std::string_view text;
  // `{` offsets already known to have no closing brace
  std::set<u64> unmatched;

  std::optional<std::vector<latex::node_t>> sequence(u64 &pos, bool nested);
  latex::node_t macro(u64 &pos) const;
  latex::node_t comment(u64 &pos) const;
  latex::node_t environment(u64 &pos) const;

public:
  explicit parser_t(std::string_view text) : text(text) {}
  std::vector<latex::node_t> run(void);
};

std::vector<latex::node_t> parser_t::run(void) {
  u64 pos = 0;
  auto nodes = this->sequence(pos, false);
  return nodes.has_value() ? std::move(nodes.value()) : std::vector<latex::node_t>();
}

// returns nullopt when `nested` and the text ends before the closing brace
std::optional<std::vector<latex::node_t>> parser_t::sequence(u64 &pos, bool nested) {
  std::vector<latex::node_t> nodes;
  std::optional<u64> run;
  auto flush = [&]() {
    if (!run.has_value()) return;
    u64 start = run.value();
    nodes.push_back({ latex::chars_t{ std::string(this->text.substr(start, pos - start)), start, pos - start } });
    run.reset();
  };
  auto chars = [&](u64 count) {
    if (!run.has_value()) run = pos;
    pos += count;
  };

  const u64 size = this->text.size();
  while (pos < size) {
    const char c = this->text[pos];
    if (c == '\\') {
      if (pos + 1 >= size) {
        chars(1);
      } else if (this->text.substr(pos, BEGIN_COMMENT.size()) == BEGIN_COMMENT) {
        flush();
        nodes.push_back(this->environment(pos));
      } else {
        flush();
        nodes.push_back(this->macro(pos));
      }
    } else if (c == '{') {
      if (this->unmatched.contains(pos)) {
        chars(1);
        continue;
      }
      const u64 start = pos;
      u64 inner       = pos + 1;
      auto children   = this->sequence(inner, true);
      if (children.has_value()) {
        flush();
        nodes.push_back({ latex::group_t{ std::move(children.value()), start, inner - start } });
        pos = inner;
      } else {
        jot::debug("latex: unmatched `{{` at {}", start);
        this->unmatched.insert(start);
        chars(1);
      }
    } else if (c == '}') {
      if (nested) {
        flush();
        pos++;
        return nodes;
      }
      chars(1);
    } else if (c == '%') {
      flush();
      nodes.push_back(this->comment(pos));
    } else {
      chars(1);
    }
  }
  flush();
  if (nested) return std::nullopt;
  return nodes;
}

latex::node_t parser_t::macro(u64 &pos) const {
  const u64 start = pos;
  const u64 size  = this->text.size();
  u64 end         = pos + 1;
  if (is_letter(this->text[end])) {
    while (end < size && is_letter(this->text[end])) end++;
  } else {
    end++;
  }
  std::string name(this->text.substr(start + 1, end - start - 1));
  if (is_letter(name.front())) {
    while (end < size && is_blank(this->text[end])) end++;
    if (end < size && this->text[end] == '\n') {
      end++;
      while (end < size && is_blank(this->text[end])) end++;
    }
  }
  pos = end;
  return { latex::macro_t{ std::move(name), start, end - start } };
}

latex::node_t parser_t::comment(u64 &pos) const {
  const u64 start = pos;
  const u64 eol   = this->text.find('\n', pos);
  pos             = eol == std::string_view::npos ? this->text.size() : eol + 1;
  return { latex::comment_t{ start, pos - start } };
}

latex::node_t parser_t::environment(u64 &pos) const {
  static const rkhash END(END_COMMENT);
  const u64 start = pos;
  auto end        = rkfind(this->text, END_COMMENT, END, pos + BEGIN_COMMENT.size());
  if (end.has_value()) {
    pos = end.value() + END_COMMENT.size();
  } else {
    jot::debug("latex: unterminated comment environment at {}", start);
    pos = this->text.size();
  }
  return { latex::comment_t{ start, pos - start } };
}
} // namespace

namespace latex {
u64 node_t::offset(void) const {
  return std::visit([](const auto &node) { return node.offset; }, this->value);
}
u64 node_t::length(void) const {
  return std::visit([](const auto &node) { return node.length; }, this->value);
}

std::string_view kind_name(kind_t kind) {
  switch (kind) {
  case kind_t::macro: return "macro";
  case kind_t::group: return "group";
  case kind_t::chars: return "chars";
  case kind_t::comment: return "comment";
  }
  return "unknown";
}

std::vector<node_t> parse(std::string_view text) { return parser_t(text).run(); }

std::string_view verbatim(std::string_view text, const node_t &node) {
  return text.substr(node.offset(), node.length());
}
} // namespace latex
