// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cirrus_log_context.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

namespace {

const char* color_for(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

std::string timestamp_of(const boost::log::record_view& rec) {
  auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  return ts ? boost::posix_time::to_iso_extended_string(*ts) : std::string();
}

}  // namespace

UploadLogContext extract_upload_context(const boost::log::record_view& rec) {
  UploadLogContext ctx;
  if (auto v = boost::log::extract<std::string>(kUploadIdAttr, rec)) {
    ctx.upload_id = *v;
  }
  if (auto v = boost::log::extract<std::string>(kObjectKeyAttr, rec)) {
    ctx.key = *v;
  }
  if (auto v = boost::log::extract<int>(kPartNumberAttr, rec)) {
    ctx.part_number = *v;
  }
  return ctx;
}

void format_text_record(
  const boost::log::record_view& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[" << timestamp_of(rec) << "] ";

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    if (use_colors) {
      strm << color_for(*sev) << "[" << *sev << "]\033[0m ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }

  strm << rec[boost::log::expressions::smessage];

  UploadLogContext ctx = extract_upload_context(rec);
  if (ctx.empty()) {
    return;
  }
  strm << " |";
  if (ctx.upload_id) strm << " upload_id=" << *ctx.upload_id;
  if (ctx.key) strm << " key=" << *ctx.key;
  if (ctx.part_number) strm << " part=" << *ctx.part_number;
}

void format_json_record(const boost::log::record_view& rec, boost::log::formatting_ostream& strm) {
  nlohmann::json line;
  line["ts"] = timestamp_of(rec);

  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    std::ostringstream level;
    level << *sev;
    line["level"] = level.str();
  }

  if (auto tid = boost::log::extract<boost::log::attributes::current_thread_id::value_type>(
        "ThreadID", rec
      )) {
    std::ostringstream id;
    id << *tid;
    line["thread_id"] = id.str();
  }

  auto message = rec[boost::log::expressions::smessage];
  line["msg"] = message ? message.get() : std::string();

  UploadLogContext ctx = extract_upload_context(rec);
  if (ctx.upload_id) line["upload_id"] = *ctx.upload_id;
  if (ctx.key) line["key"] = *ctx.key;
  if (ctx.part_number) line["part_number"] = *ctx.part_number;

  // Object keys are caller data; invalid UTF-8 must not drop the record
  strm << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace cirrus
