// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_CONSOLE_SINK_HPP
#define CAPSULE_CONSOLE_SINK_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "capsule_log_severity.hpp"

namespace capsule {
namespace logging {

/**
 * Async console sink with a bounded queue.
 * Records are dropped on overflow so a slow terminal never stalls an upload.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create the async console sink writing to std::clog.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Whether to wrap the severity tag in ANSI color codes
 * @return Shared pointer to the sink (not yet registered with the core)
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

/**
 * Append the " | recording=... upload_id=..." suffix when the record carries
 * scoped upload context. Shared by the console and text file formatters.
 */
void format_upload_context(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm
);

}  // namespace logging
}  // namespace capsule

#endif  // CAPSULE_CONSOLE_SINK_HPP
