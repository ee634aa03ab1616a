// run_logger.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>

#include "traffic_types.hpp"

namespace traffic {

struct LoggerConfig {
  int flush_every = 64;  // rows held in memory before they are written
};

// Append-only CSV of LogRecords, header first. A failed open or write turns
// logging off for the rest of the run with a single warning; the caller is
// never interrupted.
class RunLogger {
public:
  static constexpr const char* kFileName = "run_log.csv";
  static constexpr const char* kHeader =
      "stepTime,intersectionId,queueLength,meanWait,occupancy,congestionLabel,phaseIndex,decision";

  // Disabled logger, drops everything.
  RunLogger() = default;
  RunLogger(std::unique_ptr<std::ostream> sink, LoggerConfig cfg);
  // Borrowed sink; must outlive the logger.
  RunLogger(std::ostream& sink, LoggerConfig cfg);

  RunLogger(RunLogger&& o) noexcept;
  RunLogger& operator=(RunLogger&& o) noexcept;
  ~RunLogger();

  // <output_dir>/run_log.csv, creating the directory if needed.
  static RunLogger open(const std::string& output_dir, LoggerConfig cfg);

  void append(const LogRecord& r);
  void flush();
  void close();

  bool enabled() const { return out_ != nullptr && !failed_; }
  bool failed() const { return failed_; }
  size_t rows_written() const { return rows_written_; }
  size_t rows_pending() const { return pending_rows_; }

  static std::string format_row(const LogRecord& r);

private:
  void disable_(const std::string& why);

  std::unique_ptr<std::ostream> owned_;
  std::ostream* out_ = nullptr;
  LoggerConfig cfg_;
  std::string buffer_;
  size_t pending_rows_ = 0;
  size_t rows_written_ = 0;
  bool failed_ = false;
};

} // namespace traffic
