#include "fields.hpp"

#include <cctype>
#include <cstdlib>

namespace refinery::beads {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool IsFieldKey(std::string_view key) {
  if (key.empty() || !std::islower(static_cast<unsigned char>(key.front()))) return false;
  for (char c : key) {
    if (!(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) || c == '_')) {
      return false;
    }
  }
  return true;
}

// Splits "key: value". Returns false for lines that are not fields.
bool SplitField(std::string_view line, std::string_view* key, std::string_view* value) {
  const auto trimmed = Trim(line);
  const auto colon   = trimmed.find(':');
  if (colon == std::string_view::npos) return false;

  const auto k = Trim(trimmed.substr(0, colon));
  if (!IsFieldKey(k)) return false;

  *key   = k;
  *value = Trim(trimmed.substr(colon + 1));
  return true;
}

constexpr const char* kMRKeys[] = {"branch", "target",      "source_issue", "worker",    "rig",
                                   "merge_commit", "close_reason", "agent_bead", "retry_count", "convoy_id",
                                   "convoy_created_at"};

void SetIfNonEmpty(FieldBlock* block, std::string_view key, const std::string& value) {
  if (!value.empty()) block->Set(key, value);
}

} // namespace

FieldBlock::FieldBlock(std::string_view text) {
  if (text.empty()) return;

  std::size_t start = 0;
  for (;;) {
    const auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines_.emplace_back(text.substr(start));
      break;
    }
    lines_.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
}

std::optional<std::size_t> FieldBlock::FindLine(std::string_view key) const {
  for (std::size_t i = 0; i < lines_.size(); ++i) {
    std::string_view k, v;
    if (SplitField(lines_[i], &k, &v) && k == key) return i;
  }
  return std::nullopt;
}

std::optional<std::size_t> FieldBlock::LastFieldLine() const {
  std::optional<std::size_t> last;
  for (std::size_t i = 0; i < lines_.size(); ++i) {
    std::string_view k, v;
    if (SplitField(lines_[i], &k, &v)) last = i;
  }
  return last;
}

std::optional<std::string> FieldBlock::Get(std::string_view key) const {
  const auto idx = FindLine(key);
  if (!idx) return std::nullopt;

  std::string_view k, v;
  SplitField(lines_[*idx], &k, &v);
  if (v == "null") return std::string();
  return std::string(v);
}

bool FieldBlock::Has(std::string_view key) const {
  return FindLine(key).has_value();
}

void FieldBlock::Set(std::string_view key, std::string_view value) {
  std::string line(key);
  line += ": ";
  line += value;

  if (const auto idx = FindLine(key)) {
    lines_[*idx] = std::move(line);
    return;
  }
  if (const auto last = LastFieldLine()) {
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(*last + 1), std::move(line));
    return;
  }
  // keep a trailing newline trailing
  if (!lines_.empty() && lines_.back().empty()) {
    lines_.insert(lines_.end() - 1, std::move(line));
    return;
  }
  lines_.push_back(std::move(line));
}

std::string FieldBlock::Render() const {
  std::string out;
  for (std::size_t i = 0; i < lines_.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += lines_[i];
  }
  return out;
}

std::optional<MRFields> ParseMRFields(const model::Issue& issue) {
  return ParseMRFields(issue.description);
}

std::optional<MRFields> ParseMRFields(std::string_view description) {
  FieldBlock block(description);

  bool any = false;
  for (const char* key : kMRKeys) {
    if (block.Has(key)) {
      any = true;
      break;
    }
  }
  if (!any) return std::nullopt;

  MRFields f;
  f.branch            = block.Get("branch").value_or("");
  f.target            = block.Get("target").value_or("");
  f.source_issue      = block.Get("source_issue").value_or("");
  f.worker            = block.Get("worker").value_or("");
  f.rig               = block.Get("rig").value_or("");
  f.merge_commit      = block.Get("merge_commit").value_or("");
  f.close_reason      = block.Get("close_reason").value_or("");
  f.agent_bead        = block.Get("agent_bead").value_or("");
  f.convoy_id         = block.Get("convoy_id").value_or("");
  f.convoy_created_at = block.Get("convoy_created_at").value_or("");

  const auto retry = block.Get("retry_count").value_or("");
  if (!retry.empty()) {
    f.retry_count = std::atoi(retry.c_str());
    if (f.retry_count < 0) f.retry_count = 0;
  }
  return f;
}

std::string SetMRFields(std::string_view description, const MRFields& fields) {
  FieldBlock block(description);

  SetIfNonEmpty(&block, "branch", fields.branch);
  SetIfNonEmpty(&block, "target", fields.target);
  SetIfNonEmpty(&block, "source_issue", fields.source_issue);
  SetIfNonEmpty(&block, "worker", fields.worker);
  SetIfNonEmpty(&block, "rig", fields.rig);
  SetIfNonEmpty(&block, "merge_commit", fields.merge_commit);
  SetIfNonEmpty(&block, "close_reason", fields.close_reason);
  SetIfNonEmpty(&block, "agent_bead", fields.agent_bead);
  if (fields.retry_count > 0 || block.Has("retry_count")) {
    block.Set("retry_count", std::to_string(fields.retry_count));
  }
  SetIfNonEmpty(&block, "convoy_id", fields.convoy_id);
  SetIfNonEmpty(&block, "convoy_created_at", fields.convoy_created_at);

  return block.Render();
}

std::string FormatMRDescription(const MRFields& fields) {
  return SetMRFields("", fields);
}

std::string SetAgentActiveMR(std::string_view description, std::string_view mr_id) {
  FieldBlock block(description);
  block.Set("active_mr", mr_id.empty() ? std::string_view("null") : mr_id);
  return block.Render();
}

std::string GetAgentActiveMR(std::string_view description) {
  return FieldBlock(description).Get("active_mr").value_or("");
}

} // namespace refinery::beads
