// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_CONTEXT_HPP
#define CIRRUS_LOG_CONTEXT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <optional>
#include <string>

namespace cirrus {
namespace logging {

// Attribute names set by CIRRUS_LOG_SCOPED_CONTEXT / CIRRUS_LOG_SCOPED_PART
constexpr const char* kUploadIdAttr = "UploadID";
constexpr const char* kObjectKeyAttr = "ObjectKey";
constexpr const char* kPartNumberAttr = "PartNumber";

/**
 * Upload a record belongs to. Part tasks add the part number on top of
 * the session id and object key inherited from the orchestrator.
 */
struct UploadLogContext {
  std::optional<std::string> upload_id;
  std::optional<std::string> key;
  std::optional<int> part_number;

  bool empty() const { return !upload_id && !key && !part_number; }
};

UploadLogContext extract_upload_context(const boost::log::record_view& rec);

/**
 * "[ts] [LEVEL] [component] message | upload_id=.. key=.. part=.."
 * Shared by the console sink and the text file format.
 */
void format_text_record(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * One JSON object per record: ts, level, thread_id, msg and the upload context.
 */
void format_json_record(const boost::log::record_view& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_LOG_CONTEXT_HPP
