// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CAPSULE_FILE_SINK_HPP
#define CAPSULE_FILE_SINK_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "capsule_log_severity.hpp"

namespace capsule {
namespace logging {

/**
 * Async rotating file sink. The queue is larger than the console one
 * because file I/O is slower.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/capsule";
  std::string file_pattern = "uploader_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;  // one JSON object per line
};

/**
 * Create the async file sink.
 * Falls back to /tmp when the configured directory cannot be created.
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Formatters, exposed for tests.
 */
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);
void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace capsule

#endif  // CAPSULE_FILE_SINK_HPP
