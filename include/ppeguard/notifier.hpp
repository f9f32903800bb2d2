#pragma once

#include <string>

namespace ppeguard {

// Outbound operator channel. Returns false when the message could not be handed off.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool send(const std::string& text) = 0;
};

}  // namespace ppeguard
