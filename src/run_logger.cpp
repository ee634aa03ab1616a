// run_logger.cpp
#include "run_logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "csv.hpp"

namespace traffic {

RunLogger::RunLogger(std::unique_ptr<std::ostream> sink, LoggerConfig cfg)
  : owned_(std::move(sink)), out_(owned_.get()), cfg_(cfg) {
  if (out_ != nullptr) buffer_ = std::string(kHeader) + "\n";
}

RunLogger::RunLogger(std::ostream& sink, LoggerConfig cfg)
  : out_(&sink), cfg_(cfg) {
  buffer_ = std::string(kHeader) + "\n";
}

RunLogger::RunLogger(RunLogger&& o) noexcept
  : owned_(std::move(o.owned_)),
    out_(o.out_),
    cfg_(o.cfg_),
    buffer_(std::move(o.buffer_)),
    pending_rows_(o.pending_rows_),
    rows_written_(o.rows_written_),
    failed_(o.failed_) {
  o.out_ = nullptr;
  o.pending_rows_ = 0;
}

RunLogger& RunLogger::operator=(RunLogger&& o) noexcept {
  if (this == &o) return *this;
  close();
  owned_ = std::move(o.owned_);
  out_ = o.out_;
  cfg_ = o.cfg_;
  buffer_ = std::move(o.buffer_);
  pending_rows_ = o.pending_rows_;
  rows_written_ = o.rows_written_;
  failed_ = o.failed_;
  o.out_ = nullptr;
  o.pending_rows_ = 0;
  return *this;
}

RunLogger::~RunLogger() {
  close();
}

RunLogger RunLogger::open(const std::string& output_dir, LoggerConfig cfg) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    std::cerr << "warning: cannot create output directory '" << output_dir << "': " << ec.message()
              << "; run log disabled\n";
    RunLogger off;
    off.failed_ = true;
    return off;
  }

  const auto path = (std::filesystem::path(output_dir) / kFileName).string();
  auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
  if (!*file) {
    std::cerr << "warning: cannot open run log '" << path << "'; run log disabled\n";
    RunLogger off;
    off.failed_ = true;
    return off;
  }
  return RunLogger(std::move(file), cfg);
}

std::string RunLogger::format_row(const LogRecord& r) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3) << r.step_time_s << ','
     << csv_escape(r.intersection_id) << ','
     << r.queue_length << ','
     << r.mean_wait_s << ','
     << r.occupancy << ','
     << label_str(r.label) << ','
     << r.phase_index << ','
     << decision_str(r.decision);
  return os.str();
}

void RunLogger::append(const LogRecord& r) {
  if (!enabled()) return;
  buffer_ += format_row(r);
  buffer_ += '\n';
  ++pending_rows_;
  if (pending_rows_ >= static_cast<size_t>(std::max(1, cfg_.flush_every))) flush();
}

void RunLogger::flush() {
  if (!enabled()) return;
  if (!buffer_.empty()) {
    out_->write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
  }
  out_->flush();
  if (!*out_) {
    disable_("write to run log failed");
    return;
  }
  rows_written_ += pending_rows_;
  pending_rows_ = 0;
  buffer_.clear();
}

void RunLogger::close() {
  flush();
  if (owned_) {
    if (auto* file = dynamic_cast<std::ofstream*>(owned_.get())) file->close();
    owned_.reset();
  }
  out_ = nullptr;
}

void RunLogger::disable_(const std::string& why) {
  if (failed_) return;
  failed_ = true;
  std::cerr << "warning: " << why << "; " << pending_rows_
            << " buffered rows dropped, logging disabled for the rest of the run\n";
  buffer_.clear();
  pending_rows_ = 0;
}

} // namespace traffic
