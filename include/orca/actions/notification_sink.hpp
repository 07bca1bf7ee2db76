#pragma once

#include "orca/core/error.hpp"
#include "orca/core/result.hpp"

#include <string>

namespace orca::actions {

struct Notification {
    std::string block_document_id;
    std::string subject;
    std::string body;
};

/**
 * @brief Delivery channel for send-notification actions
 *
 * block_document_id names the configured destination (an email list, a
 * chat webhook); resolving it is the sink's business.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual Result<void, Error> send(const Notification& notification) = 0;
};

// Writes notifications to the service log
class LoggingNotificationSink : public NotificationSink {
public:
    Result<void, Error> send(const Notification& notification) override;
};

} // namespace orca::actions
