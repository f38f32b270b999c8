// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_CONSOLE_SINK_HPP
#define CIRRUS_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <iostream>
#include <ostream>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

// Records are dropped on overflow so part upload threads never block on the terminal
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Console sink in text format. Writes to std::clog by default; stdout is left
 * to the tool's own output (JSON results, presigned requests).
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors, std::ostream& out = std::clog
);

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_CONSOLE_SINK_HPP
