#include "listing_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <pugixml.hpp>

#include "internal/observability/logging.hpp"

namespace danmaku::listing {

using danmaku::model::Danmaku;
using danmaku::observability::IntField;
using danmaku::observability::StringField;

namespace {

constexpr std::size_t kOnlineIdIndex = 7;
// well inside int64 so llround stays defined
constexpr double      kMaxProgressMs = 9.0e15;

std::string Trim(const std::string& s) {
  const auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  const auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> Split(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string              cur;
  std::istringstream       in(s);
  while (std::getline(in, cur, sep)) out.push_back(cur);
  if (!s.empty() && s.back() == sep) out.emplace_back();
  return out;
}

// Throws std::invalid_argument / std::out_of_range on bad fields.
Danmaku FromAttributes(const std::vector<std::string>& p, const std::string& text, bool is_online) {
  const double ms = std::stod(p.at(0)) * 1000.0;
  if (!std::isfinite(ms) || std::fabs(ms) > kMaxProgressMs) throw std::invalid_argument("timestamp out of range");

  Danmaku dm;
  dm.msg         = text;
  dm.progress_ms = std::llround(ms);
  if (p.size() > 1) dm.mode = std::stoi(p[1]);
  if (p.size() > 2) dm.font_size = std::stoi(p[2]);
  if (p.size() > 3) dm.color = static_cast<uint32_t>(std::stoul(p[3]));
  if (is_online && p.size() > kOnlineIdIndex) dm.dmid = p[kOnlineIdIndex];
  return dm;
}

// 12345 -> "12.345", 12000 -> "12.0"
std::string SecondsString(int64_t ms) {
  if (ms < 0) ms = 0;
  std::string out = std::to_string(ms / 1000);
  std::string frac = std::to_string(1000 + (ms % 1000)).substr(1);
  while (frac.size() > 1 && frac.back() == '0') frac.pop_back();
  return out + "." + frac;
}

std::string SafeComment(const std::string& reason) {
  std::string out;
  for (std::size_t i = 0; i < reason.size(); ++i) {
    if (reason[i] == '-' && i + 1 < reason.size() && reason[i + 1] == '-') {
      out += " - ";
      ++i;
    } else {
      out.push_back(reason[i]);
    }
  }
  const auto first = out.find_first_not_of('-');
  if (first == std::string::npos) return {};
  const auto last = out.find_last_not_of('-');
  return out.substr(first, last - first + 1);
}

} // namespace

std::optional<std::vector<Danmaku>> TryParseListing(const std::string& xml, bool is_online) {
  pugi::xml_document     doc;
  pugi::xml_parse_result result = doc.load_string(xml.c_str());
  if (!result) {
    DANMAKU_LOG_ERROR("listing is not well-formed XML", {StringField("error", result.description()),
                                                         IntField("offset", static_cast<int64_t>(result.offset)),
                                                         IntField("bytes", static_cast<int64_t>(xml.size()))});
    return std::nullopt;
  }

  pugi::xml_node root = doc.child("i");
  if (!root) {
    DANMAKU_LOG_ERROR("listing has no <i> root", {StringField("root", doc.document_element().name())});
    return std::nullopt;
  }

  std::vector<Danmaku> out;
  for (pugi::xml_node d : root.children("d")) {
    const std::string p_attr = d.attribute("p").value();
    const std::string text   = Trim(d.child_value());

    if (text.empty()) {
      DANMAKU_LOG_DEBUG("skipping empty listing record", {StringField("p", p_attr)});
      continue;
    }

    try {
      out.push_back(FromAttributes(Split(p_attr, ','), text, is_online));
    } catch (const std::exception& e) {
      DANMAKU_LOG_WARN("skipping malformed listing record",
                       {StringField("p", p_attr), StringField("text", text), StringField("error", e.what())});
    }
  }
  return out;
}

std::vector<Danmaku> ParseListing(const std::string& xml, bool is_online) {
  return TryParseListing(xml, is_online).value_or(std::vector<Danmaku>{});
}

std::vector<Danmaku> ParseListingFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    DANMAKU_LOG_ERROR("listing file not readable", {StringField("path", path)});
    return {};
  }

  std::ostringstream buf;
  buf << in.rdbuf();
  auto items = ParseListing(buf.str(), false);
  DANMAKU_LOG_INFO("listing file loaded", {StringField("path", path), IntField("items", static_cast<int64_t>(items.size()))});
  return items;
}

bool WriteUnsentXml(const std::vector<danmaku::model::UnsentItem>& unsent, const std::string& path) {
  std::vector<std::pair<std::string, std::vector<Danmaku>>> groups;
  for (const auto& item : unsent) {
    const std::string reason = item.reason.empty() ? "unclassified" : item.reason;
    auto              it     = std::find_if(groups.begin(), groups.end(), [&](const auto& g) { return g.first == reason; });
    if (it == groups.end()) {
      groups.push_back({reason, {}});
      it = std::prev(groups.end());
    }
    it->second.push_back(item.dm);
  }

  pugi::xml_document doc;
  pugi::xml_node     decl = doc.append_child(pugi::node_declaration);
  decl.append_attribute("version")  = "1.0";
  decl.append_attribute("encoding") = "utf-8";

  pugi::xml_node root = doc.append_child("i");
  root.append_child(pugi::node_comment).set_value(" Generated by danmaku-sender ");
  for (auto& [reason, dms] : groups) {
    std::stable_sort(dms.begin(), dms.end(), [](const Danmaku& a, const Danmaku& b) { return a.progress_ms < b.progress_ms; });

    const std::string header = " === reason: " + SafeComment(reason) + " (" + std::to_string(dms.size()) + " items) === ";
    root.append_child(pugi::node_comment).set_value(header.c_str());
    for (const auto& dm : dms) {
      const std::string p = SecondsString(dm.progress_ms) + ',' + std::to_string(dm.mode) + ',' + std::to_string(dm.font_size) +
                            ',' + std::to_string(dm.color) + ",0,0,0,0,0";
      pugi::xml_node d = root.append_child("d");
      d.append_attribute("p") = p.c_str();
      d.text().set(dm.msg.c_str());
    }
  }

  // pugixml reports both open and write failures here
  if (!doc.save_file(path.c_str(), "  ")) {
    DANMAKU_LOG_ERROR("failed to write unsent output file", {StringField("path", path)});
    return false;
  }

  DANMAKU_LOG_INFO("unsent items written", {StringField("path", path), IntField("items", static_cast<int64_t>(unsent.size()))});
  return true;
}

std::string FormatProgress(int64_t ms) {
  if (ms < 0) return "-:--:--";

  const int64_t total   = ms / 1000;
  const int64_t hours   = total / 3600;
  const int64_t minutes = (total % 3600) / 60;
  const int64_t seconds = total % 60;

  char buf[32];
  if (hours > 0) {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", static_cast<long long>(hours), static_cast<long long>(minutes),
                  static_cast<long long>(seconds));
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", static_cast<long long>(minutes), static_cast<long long>(seconds));
  }
  return buf;
}

} // namespace danmaku::listing
