#pragma once

#include <string>

#include "conductor/logging/log_message.h"

namespace conductor {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [time] [LEVEL] [T:thread] [logger] [file:line] [svc:id] message {k=v}
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per record
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace conductor
