// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "capsule_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>

#include "capsule_console_sink.hpp"

namespace capsule {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

template <typename T>
std::string to_text(const T& value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

}  // namespace

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  nlohmann::json line;

  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  line["ts"] = time_stamp ? to_text(*time_stamp) : std::string();

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  line["level"] = sev ? to_text(*sev) : std::string();

  auto message = rec[expr::smessage];
  line["msg"] = message ? message.get() : std::string();

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    line["thread_id"] = to_text(*thread_id);
  }

  auto recording = boost::log::extract<std::string>("RecordingID", rec);
  if (recording) {
    line["recording"] = *recording;
  }
  auto upload_id = boost::log::extract<std::string>("UploadID", rec);
  if (upload_id && !upload_id->empty()) {
    line["upload_id"] = *upload_id;
  }

  // Invalid UTF-8 in paths must not take the sink down
  strm << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[";
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
  strm << "] ";

  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << "[" << *sev << "] ";
  }

  strm << rec[expr::smessage];
  format_upload_context(rec, strm);
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string log_directory = config.directory;
  boost::filesystem::path dir_path(log_directory);

  if (!boost::filesystem::exists(dir_path)) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(dir_path, ec);
    if (ec) {
      // Logging is not up yet, so this goes straight to stderr
      std::cerr << "[capsule_logging] Warning: Could not create log directory '"
                << config.directory << "': " << ec.message() << ". Falling back to /tmp\n";
      log_directory = "/tmp";
    }
  }

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&json_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }

  return sink;
}

}  // namespace logging
}  // namespace capsule
