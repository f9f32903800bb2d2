#pragma once

#include <memory>
#include <string>

#include "ppeguard/config.hpp"
#include "ppeguard/notifier.hpp"

namespace ppeguard {

// Publishes alerts as JSON to an MQTT broker through libmosquitto's network thread.
// With no server configured the notifier stays disabled and every send fails.
class MqttNotifier : public Notifier {
public:
    MqttNotifier(MqttConfig config, std::string service_name);
    ~MqttNotifier() override;

    MqttNotifier(const MqttNotifier&) = delete;
    MqttNotifier& operator=(const MqttNotifier&) = delete;

    void start();
    void stop();

    bool send(const std::string& text) override;

    bool enabled() const;
    bool connected() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace ppeguard
