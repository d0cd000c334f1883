#pragma once

#include <string>

namespace tactile {
namespace transport {

class ScanEventQueue;

// Discovery front-end for one transport kind.
//
// Contract:
// - start_scanning() while already scanning is a no-op returning true
// - stop_scanning() followed by start_scanning() is valid (restartable)
// - found/lost/notification events are pushed into the queue given to
//   set_event_queue(); the scanner never calls into the registry directly
class ITransportScanner {
public:
    virtual ~ITransportScanner() = default;

    virtual const std::string &transport_kind() const = 0;

    virtual void set_event_queue(ScanEventQueue *queue) = 0;

    virtual bool start_scanning() = 0;
    virtual void stop_scanning() = 0;
    virtual bool is_scanning() const = 0;

    virtual std::string last_error() const = 0;
};

}  // namespace transport
}  // namespace tactile
