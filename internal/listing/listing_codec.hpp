#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/danmaku.hpp"
#include "internal/model/unsent_item.hpp"

namespace danmaku::listing {

/*
  Provider listing format:

    <i>
      <d p="12.345,1,25,16777215,...">text</d>
    </i>

  p[0] seconds (x1000 -> ms), p[1] mode, p[2] size, p[3] color; the online
  listing carries the provider id at p[7].
*/

// nullopt when the document is not well-formed XML or its root is not <i>.
// Malformed or empty records inside a valid listing are skipped and logged.
std::optional<std::vector<danmaku::model::Danmaku>> TryParseListing(const std::string& xml, bool is_online);

// Same as TryParseListing, with an unusable document yielding an empty list.
std::vector<danmaku::model::Danmaku> ParseListing(const std::string& xml, bool is_online);

// Offline variant. A missing or unreadable file is logged and yields an empty list.
std::vector<danmaku::model::Danmaku> ParseListingFile(const std::string& path);

// Writes unsent items grouped by reason (first-seen order), sorted by
// progress inside each group. Returns false on I/O failure.
bool WriteUnsentXml(const std::vector<danmaku::model::UnsentItem>& unsent, const std::string& path);

// "MM:SS", or "HH:MM:SS" from one hour on; "-:--:--" for negative input.
std::string FormatProgress(int64_t ms);

} // namespace danmaku::listing
