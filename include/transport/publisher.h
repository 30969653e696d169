#pragma once

#include <string>

namespace show_ingest::transport {

/**
 * @brief Fire-and-forget message sink.
 *
 * publish() returns false when the payload could not be handed to the
 * transport. Callers log and drop; there is no redelivery.
 */
class Publisher {
   public:
    virtual ~Publisher() = default;

    virtual bool publish(const std::string& subject, const std::string& payload) = 0;

    virtual const char* name() const = 0;
};

}  // namespace show_ingest::transport
