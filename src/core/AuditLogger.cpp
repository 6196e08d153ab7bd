/* @file AuditLogger.cpp
 * @brief ring-buffered audit events drained to CSV by a worker thread
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <sstream>

// Stocktake headers
#include "core/AuditLogger.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/RingBuffer.hpp"

using namespace stocktake::core;

namespace {

  constexpr auto kPollInterval = std::chrono::milliseconds{ 100 };

  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\r\n") == std::string::npos)
      return raw;
    std::string out = "\"";
    for (char c : raw) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

std::string AuditEvent::toCsv() const {
  std::ostringstream os;
  os << toMillis(at) << ',' << csvField(event) << ',' << csvField(session) << ','
     << csvField(item) << ',' << csvField(actor) << ',' << csvField(detail) << '\n';
  return os.str();
}

AuditLogger::AuditLogger(std::shared_ptr<ErrorMonitor> errorMonitor, std::size_t capacity)
    : errorMonitor_(std::move(errorMonitor)), capacity_(capacity) {}

AuditLogger::~AuditLogger() { stop(); }

bool AuditLogger::start(const std::string& path) {
  if (running_.load())
    return true;

  if (!file_.open(path)) {
    if (errorMonitor_)
      errorMonitor_->notifyFailure("[AuditLogger] cannot open " + path);
    return false;
  }
  if (file_.wasEmpty() && !file_.write("timestamp,event,session,item,actor,detail\n")) {
    file_.close();
    return false;
  }

  path_ = path;
  buffer_ = std::make_unique<RingBuffer<AuditEvent>>(capacity_);
  running_ = true;
  worker_ = std::thread([this] { drain(); });
  return true;
}

void AuditLogger::log(AuditEvent event) {
  if (!running_.load())
    return;
  if (!buffer_->tryPush(std::move(event)))
    ++dropped_;
}

void AuditLogger::stop() {
  if (!running_.exchange(false))
    return;
  buffer_->close();
  if (worker_.joinable())
    worker_.join();
  file_.close();
}

void AuditLogger::drain() {
  while (true) {
    if (auto ev = buffer_->pop(kPollInterval)) {
      if (!file_.write(ev->toCsv()) && errorMonitor_)
        errorMonitor_->notifyFailure("[AuditLogger] write to " + path_ + " failed");
      continue;
    }
    // idle or closing: push what we have to disk
    if (!file_.flush() && errorMonitor_)
      errorMonitor_->notifyFailure("[AuditLogger] write to " + path_ + " failed");
    if (buffer_->drained())
      break;
  }
}
