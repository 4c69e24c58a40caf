#pragma once

#include <boost/log/attributes/attribute_cast.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <filesystem>
#include <string>

#include "conf/launcher_config.hpp"

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace sinks = boost::log::sinks;
namespace trivial = logging::trivial;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(
    devlaunch_logger, src::severity_logger_mt<trivial::severity_level>)

namespace devlaunch {

constexpr const char kDeviceIdAttribute[] = "DeviceID";

inline trivial::severity_level parse_severity(const std::string &level) {
  if (level == "trace") {
    return trivial::trace;
  } else if (level == "debug") {
    return trivial::debug;
  } else if (level == "info") {
    return trivial::info;
  } else if (level == "warning") {
    return trivial::warning;
  } else if (level == "error") {
    return trivial::error;
  } else if (level == "fatal") {
    return trivial::fatal;
  }
  return trivial::info;
}

// Rotating file sink under `log_dir`. Records carry the DeviceID attribute,
// "-" until tag_logs_with_device() is called.
inline void init_my_log(const LoggingConfig &loggingConfig) {
  std::filesystem::path log_dir(loggingConfig.log_dir);
  std::string logfile =
      (log_dir / (loggingConfig.log_file + "_%N.log")).string();

  auto sink = logging::add_file_log(
      logging::keywords::file_name = logfile,
      logging::keywords::rotation_size = loggingConfig.rotation_size,
      logging::keywords::format = "[%TimeStamp%] [%Severity%] [%DeviceID%]: "
                                  "%Message%",
      logging::keywords::auto_flush = true,
      logging::keywords::open_mode = std::ios_base::app);
  sink->locked_backend()->set_file_collector(
      logging::sinks::file::make_collector(
          logging::keywords::target = log_dir.string(),
          logging::keywords::max_size = loggingConfig.rotation_size * 10,
          logging::keywords::max_files = 10));
  sink->locked_backend()->scan_for_files();

  logging::add_common_attributes();
  logging::core::get()->add_global_attribute(
      kDeviceIdAttribute,
      logging::attributes::mutable_constant<std::string>("-"));
  logging::core::get()->set_filter(logging::trivial::severity >=
                                   parse_severity(loggingConfig.level));
}

// Replace the DeviceID attribute value for all subsequent records.
inline void tag_logs_with_device(const std::string &public_id) {
  auto attrs = logging::core::get()->get_global_attributes();
  auto it = attrs.find(kDeviceIdAttribute);
  if (it == attrs.end()) {
    logging::core::get()->add_global_attribute(
        kDeviceIdAttribute,
        logging::attributes::mutable_constant<std::string>(public_id));
    return;
  }
  auto tag = logging::attribute_cast<
      logging::attributes::mutable_constant<std::string>>(it->second);
  if (tag) {
    tag.set(public_id);
  }
}

} // namespace devlaunch
